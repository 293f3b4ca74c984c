#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "BatchRunner.h"
#include "CoreSettings.h"
#include "DirectoryLoader.h"
#include "NotificationCenter.h"
#include "PanelStore.h"
#include "StorageBackend.h"

namespace mosaic {

// Clipboard and drag staging plus the one routine that copies or moves a
// batch of entries into another panel's directory.
class TransferCoordinator final {
public:
  using TransferDone = std::function<void(const BatchReport& report)>;

  TransferCoordinator(PanelStore& store,
                      NotificationCenter& notifications,
                      DirectoryLoader& loader,
                      BatchRunner& batches,
                      StorageBackend& backend,
                      const CoreSettings& settings);

  OpResult StageCopy(const std::string& panelId, std::vector<FileInfo> files);
  OpResult StageCut(const std::string& panelId, std::vector<FileInfo> files);

  // On success `progressId` receives the batch id and `done` runs when the
  // batch ends. On a validation failure nothing starts and `done` is not called.
  OpResult Paste(const std::string& destPanelId, TransferDone done = {},
                 std::string* progressId = nullptr);

  // Drags the selection when `itemName` is selected, otherwise just that item.
  // A held copy modifier selects copy; move is the default.
  bool StartDrag(const std::string& panelId, const std::string& itemName, bool copyModifier);
  void UpdateDragOperation(const std::string& targetPanelId, bool copyModifier);
  void EndDrag();
  // Always ends the drag, whether or not a transfer starts.
  OpResult Drop(const std::string& targetPanelId, TransferDone done = {},
                std::string* progressId = nullptr);

  // `stamp` names the clipboard stage a paste came from; the clipboard is only
  // cleared if it still holds that stage when the batch ends.
  OpResult ExecuteTransfer(std::vector<FileInfo> batch,
                           const std::string& sourcePanelId,
                           const std::string& destPanelId,
                           TransferOp operation,
                           std::optional<std::uint64_t> stamp,
                           TransferDone done = {},
                           std::string* progressId = nullptr);

  bool Cancel(const std::string& progressId);

private:
  OpResult Stage(ClipboardOp op, const std::string& panelId, std::vector<FileInfo> files);
  void OnTransferFinished(const BatchReport& report,
                          TransferOp operation,
                          const std::string& destDir,
                          const std::vector<std::string>& sourceDirs,
                          std::optional<std::uint64_t> stamp);

  PanelStore& store_;
  NotificationCenter& notifications_;
  DirectoryLoader& loader_;
  BatchRunner& batches_;
  StorageBackend& backend_;
  const CoreSettings& settings_;
};

}  // namespace mosaic
