#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "BatchRunner.h"
#include "CoreSettings.h"
#include "DialogService.h"
#include "DirectoryLoader.h"
#include "Model.h"
#include "NotificationCenter.h"
#include "PanelStore.h"
#include "StorageBackend.h"
#include "TransferCoordinator.h"
#include "util.h"

namespace mosaic {

struct CommandDescriptor {
  std::string id;
  std::string label;
  std::string category;
  std::optional<std::string> description;
  std::optional<std::string> icon;
  std::optional<std::string> shortcut;
};

struct CommandOptions {
  std::optional<std::string> panelId;
  std::optional<std::string> path;
  std::optional<std::string> newName;
  std::optional<std::string> name;
  std::optional<std::string> transferId;
  bool navigateToTarget{false};
};

using DispatchFn =
    std::function<void(const std::string& commandId, const CommandOptions& options, Completion done)>;

// Snapshot handed to one command invocation. Built per dispatch, never stored.
struct ExecutionContext {
  std::string panelId;
  std::string currentPath;
  // Selection resolved against the listing at dispatch time.
  std::vector<FileInfo> selectedFiles;
  ClipboardState clipboard;
  DragState drag;
  std::map<std::string, Panel> panels;
  DispatchFn dispatch;

  bool HasPanel() const { return panels.count(panelId) != 0; }
};

// Collaborators every command may reach. Bound once when the table is built.
struct CommandServices {
  PanelStore& store;
  NotificationCenter& notifications;
  DirectoryLoader& loader;
  TransferCoordinator& transfers;
  BatchRunner& batches;
  StorageBackend& backend;
  DialogService& dialogs;
  const CoreSettings& settings;
};

class Command {
public:
  explicit Command(CommandDescriptor descriptor) : descriptor_(std::move(descriptor)) {}
  virtual ~Command() = default;

  Command(const Command&) = delete;
  Command& operator=(const Command&) = delete;

  const CommandDescriptor& Descriptor() const { return descriptor_; }
  const std::string& Id() const { return descriptor_.id; }

  virtual bool CanExecute(const ExecutionContext& ctx, const CommandOptions& options) const;
  // Must call `done` exactly once, possibly after asynchronous work.
  virtual void Execute(const ExecutionContext& ctx, const CommandOptions& options, Completion done) = 0;
  // Prepended to backend and runtime error messages, e.g. "Failed to rename".
  virtual std::string ErrorPrefix() const;

private:
  CommandDescriptor descriptor_;
};

// Commands acting on the selected entries of a panel.
class FileOperationCommand : public Command {
public:
  FileOperationCommand(CommandDescriptor descriptor, CommandServices& services,
                       size_t minSelection, std::optional<size_t> maxSelection = std::nullopt);

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions& options) const override;

protected:
  virtual std::string ConfirmationMessage(const ExecutionContext& ctx) const;

  CommandServices& services_;

private:
  size_t minSelection_{0};
  std::optional<size_t> maxSelection_;
};

// Commands that move a panel to another directory.
class NavigationCommand : public Command {
public:
  NavigationCommand(CommandDescriptor descriptor, CommandServices& services)
      : Command(std::move(descriptor)), services_(services) {}

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions& options) const override;

protected:
  void NavigateTo(const ExecutionContext& ctx, const std::string& target, Completion done);

  CommandServices& services_;
};

// Maps a finished batch to the command's result. The batch has already been
// reported to the user, so the result is marked as such.
OpResult ResultFromReport(const BatchReport& report);

}  // namespace mosaic
