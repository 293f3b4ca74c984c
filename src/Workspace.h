#pragma once

#include <memory>
#include <string>
#include <vector>

#include "BatchRunner.h"
#include "CommandRegistry.h"
#include "CoreSettings.h"
#include "DialogService.h"
#include "DirectoryLoader.h"
#include "NotificationCenter.h"
#include "PanelStore.h"
#include "Scheduler.h"
#include "StorageBackend.h"
#include "TransferCoordinator.h"

namespace mosaic {

// Owns one instance of every core component and wires them to the external
// collaborators, which must outlive it.
class Workspace final {
public:
  Workspace(StorageBackend& backend, DialogService& dialogs, Scheduler& scheduler,
            CoreSettings settings = {});

  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  void Dispatch(const std::string& commandId, const CommandOptions& options = {},
                Completion done = {});

  // Lists `path` (or the default path) in every panel.
  void LoadAllPanels(const std::string& path = {});
  // Loads each panel from `paths` in order; panels beyond the list get the last entry.
  void LoadPanels(const std::vector<std::string>& paths);

  // True while a command, listing or batch is still running.
  bool IsBusy() const;

  PanelStore& Store() { return store_; }
  NotificationCenter& Notifications() { return notifications_; }
  DirectoryLoader& Loader() { return loader_; }
  BatchRunner& Batches() { return batches_; }
  TransferCoordinator& Transfers() { return transfers_; }
  CommandRegistry& Commands() { return *registry_; }
  const CoreSettings& Settings() const { return settings_; }

private:
  CoreSettings settings_;
  StorageBackend& backend_;
  DialogService& dialogs_;
  PanelStore store_;
  NotificationCenter notifications_;
  DirectoryLoader loader_;
  BatchRunner batches_;
  TransferCoordinator transfers_;
  CommandServices services_;
  std::unique_ptr<CommandRegistry> registry_;
};

}  // namespace mosaic
