#include "TransferCoordinator.h"

#include <algorithm>
#include <set>

#include <wx/log.h>

namespace mosaic {

namespace {

struct PlannedItem {
  std::string src;
  std::string dst;
  bool sameLocation{false};
};

}  // namespace

TransferCoordinator::TransferCoordinator(PanelStore& store,
                                         NotificationCenter& notifications,
                                         DirectoryLoader& loader,
                                         BatchRunner& batches,
                                         StorageBackend& backend,
                                         const CoreSettings& settings)
    : store_(store),
      notifications_(notifications),
      loader_(loader),
      batches_(batches),
      backend_(backend),
      settings_(settings) {}

OpResult TransferCoordinator::StageCopy(const std::string& panelId, std::vector<FileInfo> files) {
  return Stage(ClipboardOp::Copy, panelId, std::move(files));
}

OpResult TransferCoordinator::StageCut(const std::string& panelId, std::vector<FileInfo> files) {
  return Stage(ClipboardOp::Cut, panelId, std::move(files));
}

OpResult TransferCoordinator::Stage(ClipboardOp op, const std::string& panelId,
                                    std::vector<FileInfo> files) {
  if (files.empty()) return ErrorResult(ErrorKind::Validation, "No files selected");
  const auto count = files.size();
  const auto stamp = store_.StageClipboard(std::move(files), op, panelId);
  wxLogDebug("Clipboard stage %llu: %s %zu item(s) from %s", static_cast<unsigned long long>(stamp),
             op == ClipboardOp::Cut ? "cut" : "copy", count, panelId);
  return OkResult();
}

OpResult TransferCoordinator::Paste(const std::string& destPanelId, TransferDone done,
                                    std::string* progressId) {
  const auto clip = store_.Clipboard();
  if (!clip.hasFiles || clip.files.empty()) {
    return ErrorResult(ErrorKind::Validation, "No files in clipboard to paste");
  }
  const auto op = clip.operation == ClipboardOp::Cut ? TransferOp::Move : TransferOp::Copy;
  return ExecuteTransfer(clip.files, clip.sourcePanelId, destPanelId, op, clip.stamp,
                         std::move(done), progressId);
}

bool TransferCoordinator::StartDrag(const std::string& panelId, const std::string& itemName,
                                    bool copyModifier) {
  const auto* panel = store_.GetPanel(panelId);
  if (!panel) return false;
  const bool listed = std::any_of(panel->files.begin(), panel->files.end(),
                                  [&](const FileInfo& f) { return f.name == itemName; });
  if (!listed) return false;

  std::vector<std::string> names;
  if (panel->selectedFiles.count(itemName)) {
    for (const auto& f : ResolveSelection(*panel)) names.push_back(f.name);
  } else {
    names.push_back(itemName);
  }

  const auto op = copyModifier ? TransferOp::Copy : TransferOp::Move;
  wxLogDebug("Drag started from %s with %zu item(s) (%s)", panelId, names.size(), TransferOpName(op));
  store_.BeginDrag(std::move(names), panelId, op);
  return true;
}

void TransferCoordinator::UpdateDragOperation(const std::string& targetPanelId, bool copyModifier) {
  if (!store_.Drag().isDragging) return;
  const auto op = copyModifier ? TransferOp::Copy : TransferOp::Move;
  if (op != store_.Drag().operation) {
    wxLogDebug("Drag over %s switched to %s", targetPanelId, TransferOpName(op));
  }
  store_.SetDragOperation(op);
}

void TransferCoordinator::EndDrag() { store_.EndDrag(); }

OpResult TransferCoordinator::Drop(const std::string& targetPanelId, TransferDone done,
                                   std::string* progressId) {
  const auto drag = store_.Drag();
  store_.EndDrag();

  if (!drag.isDragging) return ErrorResult(ErrorKind::Validation, "No drag in progress");

  const auto* source = store_.GetPanel(drag.sourcePanelId);
  if (!source) {
    return ErrorResult(ErrorKind::NotFound,
                       wxString::Format("Source panel %s no longer exists", drag.sourcePanelId));
  }

  const std::set<std::string> names(drag.draggedFiles.begin(), drag.draggedFiles.end());
  std::vector<FileInfo> batch;
  for (const auto& f : SortedFiles(*source)) {
    if (names.count(f.name)) batch.push_back(f);
  }
  if (batch.empty()) {
    return ErrorResult(ErrorKind::Validation, "Dragged files are no longer available");
  }

  return ExecuteTransfer(std::move(batch), drag.sourcePanelId, targetPanelId, drag.operation,
                         std::nullopt, std::move(done), progressId);
}

OpResult TransferCoordinator::ExecuteTransfer(std::vector<FileInfo> batch,
                                              const std::string& sourcePanelId,
                                              const std::string& destPanelId,
                                              TransferOp operation,
                                              std::optional<std::uint64_t> stamp,
                                              TransferDone done,
                                              std::string* progressId) {
  const auto* dest = store_.GetPanel(destPanelId);
  if (!dest) {
    return ErrorResult(ErrorKind::NotFound,
                       wxString::Format("Destination panel %s not found", destPanelId));
  }
  if (batch.empty()) return ErrorResult(ErrorKind::Validation, "Nothing to transfer");

  const auto destDir = dest->currentPath;

  // Names are reserved up front against the destination listing so two
  // items with the same basename never target the same path.
  std::set<std::string> taken;
  for (const auto& f : dest->files) taken.insert(f.name);

  std::vector<PlannedItem> plan;
  std::vector<std::string> labels;
  std::vector<std::string> sourceDirs;
  for (const auto& f : batch) {
    // Listed paths go to the backend untouched; the name comes from the listing.
    const auto& src = f.path;
    const auto base = f.name.empty() ? BaseName(src) : f.name;
    PlannedItem item{.src = src};

    if (JoinPath(destDir, base) == NormalizeDir(src)) {
      item.sameLocation = true;
      item.dst = src;
    } else {
      const auto name = UniqueName(base, taken);
      taken.insert(name);
      item.dst = JoinPath(destDir, name);
      if (name != base) wxLogDebug("%s exists in %s, using %s", base, destDir, name);
    }

    const auto parent = ParentPath(src);
    if (std::find(sourceDirs.begin(), sourceDirs.end(), parent) == sourceDirs.end()) {
      sourceDirs.push_back(parent);
    }
    labels.push_back(base);
    plan.push_back(std::move(item));
  }

  const auto batchOp = operation == TransferOp::Copy ? BatchOp::Copy : BatchOp::Move;
  wxLogMessage("%s %zu item(s) from %s to %s (%s)", TransferOpName(operation), plan.size(),
               sourcePanelId, destPanelId, destDir);

  BatchSpec spec{
      .operation = batchOp,
      .labels = std::move(labels),
      .run = [this, plan, operation](size_t index, Completion itemDone) {
        const auto& item = plan[index];
        if (item.sameLocation) {
          itemDone(SkippedResult("Source and destination are the same"));
          return;
        }
        if (operation == TransferOp::Copy) {
          backend_.Copy(item.src, item.dst, std::move(itemDone));
        } else {
          backend_.Move(item.src, item.dst, std::move(itemDone));
        }
      },
      .finish = [this, operation, destDir, sourceDirs, stamp, done](const BatchReport& report) {
        OnTransferFinished(report, operation, destDir, sourceDirs, stamp);
        if (done) done(report);
      },
  };

  const auto id = batches_.Start(std::move(spec));
  if (progressId) *progressId = id;
  return OkResult();
}

void TransferCoordinator::OnTransferFinished(const BatchReport& report,
                                             TransferOp operation,
                                             const std::string& destDir,
                                             const std::vector<std::string>& sourceDirs,
                                             std::optional<std::uint64_t> stamp) {
  if (report.succeeded > 0) {
    loader_.RefreshPanelsShowing(destDir);
    if (operation == TransferOp::Move) {
      for (const auto& dir : sourceDirs) {
        if (NormalizeDir(dir) != NormalizeDir(destDir)) loader_.RefreshPanelsShowing(dir);
      }
    }
  }

  const auto& clip = store_.Clipboard();
  const bool ownsClipboard = stamp && clip.hasFiles && clip.stamp == *stamp;
  const bool clearable = report.state == BatchState::Completed ||
                         (report.state == BatchState::PartiallyFailed && report.succeeded > 0);
  if (ownsClipboard && clip.operation == ClipboardOp::Cut && clearable) {
    store_.ClearClipboard();
  }

  ReportBatch(notifications_, report, settings_.summaryErrorCount);
}

bool TransferCoordinator::Cancel(const std::string& progressId) { return batches_.Cancel(progressId); }

}  // namespace mosaic
