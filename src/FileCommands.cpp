#include "CommandFactory.h"

#include <algorithm>
#include <memory>

namespace mosaic {

namespace {

using AnswerFn = std::function<void(const std::string& answer)>;

// Uses `preset` when the caller supplied one, otherwise asks the user.
void AskOrUse(DialogService& dialogs, const std::optional<std::string>& preset,
              const std::string& message, const std::string& defaultValue,
              const std::string& cancelMessage, Completion done, AnswerFn next) {
  if (preset) {
    next(*preset);
    return;
  }
  dialogs.Prompt(message, defaultValue,
                 [done, cancelMessage, next](std::optional<std::string> answer) {
                   if (!answer) {
                     done(CanceledResult(cancelMessage));
                     return;
                   }
                   next(*answer);
                 });
}

class CreateEntryCommand final : public FileOperationCommand {
public:
  CreateEntryCommand(CommandDescriptor d, CommandServices& s, EntryKind kind)
      : FileOperationCommand(std::move(d), s, 0), kind_(kind) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions& options, Completion done) override {
    const bool folder = kind_ == EntryKind::Folder;
    const auto panelId = ctx.panelId;
    const auto currentPath = ctx.currentPath;
    const bool navigate = options.navigateToTarget;

    AskOrUse(services_.dialogs, options.name,
             folder ? "Enter folder name:" : "Enter file name:",
             folder ? "New Folder" : "untitled.txt",
             folder ? "Folder creation cancelled" : "File creation cancelled", done,
             [this, folder, panelId, currentPath, navigate, done](const std::string& input) {
               std::string dir;
               std::string name;
               const auto parsed = ParseFileInput(input, currentPath, &dir, &name);
               if (!parsed.ok()) {
                 done(parsed);
                 return;
               }

               services_.backend.Create(dir, name, kind_,
                                        [this, folder, panelId, dir, name, navigate, done](const OpResult& res) {
                 if (!res.ok()) {
                   done(res);
                   return;
                 }
                 services_.loader.RefreshPanelsShowing(dir);
                 const auto* panel = services_.store.GetPanel(panelId);
                 if (navigate && panel && NormalizeDir(panel->currentPath) != NormalizeDir(dir)) {
                   services_.loader.Load(panelId, dir);
                 }
                 services_.notifications.Success(
                     wxString::Format("Created %s %s", folder ? "folder" : "file", name).ToStdString(),
                     panelId);
                 done(OkResult());
               });
             });
  }

private:
  EntryKind kind_;
};

class DeleteFilesCommand final : public FileOperationCommand {
public:
  DeleteFilesCommand(CommandDescriptor d, CommandServices& s) : FileOperationCommand(std::move(d), s, 1) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    const auto files = ctx.selectedFiles;
    const auto panelId = ctx.panelId;
    services_.dialogs.Confirm(ConfirmationMessage(ctx), [this, files, panelId, done](bool accepted) {
      if (!accepted) {
        done(CanceledResult("Delete operation cancelled"));
        return;
      }

      std::vector<std::string> labels;
      std::vector<std::string> parents;
      for (const auto& f : files) {
        labels.push_back(f.name);
        const auto parent = ParentPath(f.path);
        if (std::find(parents.begin(), parents.end(), parent) == parents.end()) parents.push_back(parent);
      }

      auto deleted = std::make_shared<std::vector<FileInfo>>();
      services_.batches.Start(BatchSpec{
          .operation = BatchOp::Delete,
          .labels = std::move(labels),
          .run = [this, files, deleted](size_t index, Completion itemDone) {
            const auto file = files[index];
            services_.backend.Delete(file.path, [file, deleted, itemDone](const OpResult& res) {
              if (res.ok()) deleted->push_back(file);
              itemDone(res);
            });
          },
          .finish = [this, panelId, parents, deleted, done](const BatchReport& report) {
            DeselectDeleted(panelId, *deleted);
            if (report.succeeded > 0) {
              for (const auto& dir : parents) services_.loader.RefreshPanelsShowing(dir);
            }
            ReportBatch(services_.notifications, report, services_.settings.summaryErrorCount);
            done(ResultFromReport(report));
          },
      });
    });
  }

protected:
  std::string ConfirmationMessage(const ExecutionContext& ctx) const override {
    if (ctx.selectedFiles.size() == 1) {
      return "Delete \"" + ctx.selectedFiles.front().name + "\"? This cannot be undone.";
    }
    return wxString::Format("Delete %zu items? This cannot be undone.", ctx.selectedFiles.size())
        .ToStdString();
  }

private:
  // The panel may have moved on while the batch ran; only names deleted
  // from the folder it shows now leave its selection.
  void DeselectDeleted(const std::string& panelId, const std::vector<FileInfo>& deleted) {
    const auto* panel = services_.store.GetPanel(panelId);
    if (!panel) return;
    const auto shown = NormalizeDir(panel->currentPath);
    auto selection = panel->selectedFiles;
    for (const auto& f : deleted) {
      if (ParentPath(f.path) == shown) selection.erase(f.name);
    }
    if (selection.size() == panel->selectedFiles.size()) return;
    services_.store.SelectFiles(panelId, std::vector<std::string>(selection.begin(), selection.end()),
                                false);
  }
};

class RenameFileCommand final : public FileOperationCommand {
public:
  RenameFileCommand(CommandDescriptor d, CommandServices& s) : FileOperationCommand(std::move(d), s, 1, 1) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions& options, Completion done) override {
    const auto file = ctx.selectedFiles.front();
    const auto panelId = ctx.panelId;

    AskOrUse(services_.dialogs, options.newName, "Enter new name:", file.name,
             "Rename operation cancelled", done,
             [this, file, panelId, done](const std::string& input) {
               const auto newName = Trim(input);
               if (newName == file.name) {
                 done(CanceledResult("Name unchanged"));
                 return;
               }
               if (!IsValidEntryName(newName)) {
                 done(ErrorResult(ErrorKind::Validation,
                                  newName.empty() ? wxString("Name cannot be empty")
                                                  : wxString::Format("Invalid name: %s", newName)));
                 return;
               }

               services_.backend.Rename(file.path, newName,
                                        [this, file, newName, panelId, done](const OpResult& res) {
                 if (!res.ok()) {
                   done(res);
                   return;
                 }
                 const auto* panel = services_.store.GetPanel(panelId);
                 if (panel && NormalizeDir(panel->currentPath) == ParentPath(file.path)) {
                   services_.store.SelectFiles(panelId, {newName}, false);
                 }
                 services_.loader.RefreshPanelsShowing(ParentPath(file.path));
                 services_.notifications.Success("Renamed " + file.name + " to " + newName, panelId);
                 done(OkResult());
               });
             });
  }
};

class StageClipboardCommand final : public FileOperationCommand {
public:
  StageClipboardCommand(CommandDescriptor d, CommandServices& s, ClipboardOp op)
      : FileOperationCommand(std::move(d), s, 1), op_(op) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    const auto count = ctx.selectedFiles.size();
    const auto res = op_ == ClipboardOp::Cut ? services_.transfers.StageCut(ctx.panelId, ctx.selectedFiles)
                                             : services_.transfers.StageCopy(ctx.panelId, ctx.selectedFiles);
    if (!res.ok()) {
      done(res);
      return;
    }
    services_.notifications.Info(
        wxString::Format("%s %zu item(s) to clipboard", op_ == ClipboardOp::Cut ? "Cut" : "Copied", count)
            .ToStdString(),
        ctx.panelId);
    done(OkResult());
  }

private:
  ClipboardOp op_;
};

class PasteFilesCommand final : public FileOperationCommand {
public:
  PasteFilesCommand(CommandDescriptor d, CommandServices& s) : FileOperationCommand(std::move(d), s, 0) {}

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions& options) const override {
    return FileOperationCommand::CanExecute(ctx, options) && ctx.clipboard.hasFiles;
  }

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    const auto res = services_.transfers.Paste(
        ctx.panelId, [done](const BatchReport& report) { done(ResultFromReport(report)); });
    if (!res.ok()) done(res);
  }
};

class LoadDirectoryCommand final : public FileOperationCommand {
public:
  LoadDirectoryCommand(CommandDescriptor d, CommandServices& s) : FileOperationCommand(std::move(d), s, 0) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions& options, Completion done) override {
    const auto panelId = ctx.panelId;
    AskOrUse(services_.dialogs, options.path, "Enter directory path:", ctx.currentPath,
             "Load directory cancelled", done, [this, panelId, done](const std::string& input) {
               const auto path = Trim(input);
               if (path.empty()) {
                 done(ErrorResult(ErrorKind::Validation, "Path cannot be empty"));
                 return;
               }
               services_.loader.Load(panelId, path, done);
             });
  }
};

class RefreshPanelCommand final : public FileOperationCommand {
public:
  RefreshPanelCommand(CommandDescriptor d, CommandServices& s) : FileOperationCommand(std::move(d), s, 0) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    services_.loader.Refresh(ctx.panelId, std::move(done));
  }
};

class SelectionCommand final : public FileOperationCommand {
public:
  SelectionCommand(CommandDescriptor d, CommandServices& s, bool selectAll)
      : FileOperationCommand(std::move(d), s, 0), selectAll_(selectAll) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    std::vector<std::string> names;
    if (selectAll_) {
      for (const auto& f : ctx.panels.at(ctx.panelId).files) names.push_back(f.name);
    }
    services_.store.SelectFiles(ctx.panelId, names, false);
    done(OkResult());
  }

private:
  bool selectAll_{false};
};

class HandleDropCommand final : public FileOperationCommand {
public:
  HandleDropCommand(CommandDescriptor d, CommandServices& s) : FileOperationCommand(std::move(d), s, 0) {}

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions& options) const override {
    return FileOperationCommand::CanExecute(ctx, options) && ctx.drag.isDragging;
  }

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    const auto res = services_.transfers.Drop(
        ctx.panelId, [done](const BatchReport& report) { done(ResultFromReport(report)); });
    if (!res.ok()) done(res);
  }
};

class CancelTransferCommand final : public Command {
public:
  CancelTransferCommand(CommandDescriptor d, CommandServices& s) : Command(std::move(d)), services_(s) {}

  bool CanExecute(const ExecutionContext&, const CommandOptions& options) const override {
    return options.transferId && services_.batches.IsRunning(*options.transferId);
  }

  void Execute(const ExecutionContext&, const CommandOptions& options, Completion done) override {
    if (!services_.transfers.Cancel(*options.transferId)) {
      done(ErrorResult(ErrorKind::NotFound,
                       wxString::Format("Transfer %s is not running", *options.transferId)));
      return;
    }
    done(OkResult());
  }

private:
  CommandServices& services_;
};

CommandDescriptor Describe(const char* id, const char* label, const char* description,
                           const char* icon, const char* shortcut) {
  CommandDescriptor d{.id = id, .label = label, .category = "File"};
  if (description) d.description = description;
  if (icon) d.icon = icon;
  if (shortcut) d.shortcut = shortcut;
  return d;
}

}  // namespace

std::vector<std::unique_ptr<Command>> MakeFileCommands(CommandServices& s) {
  std::vector<std::unique_ptr<Command>> c;
  c.push_back(std::make_unique<CreateEntryCommand>(
      Describe("create-file", "Create File", "Create a new empty file in the current folder",
               "file-plus", "Ctrl+N"),
      s, EntryKind::File));
  c.push_back(std::make_unique<CreateEntryCommand>(
      Describe("create-folder", "Create Folder", "Create a new folder in the current folder",
               "folder-plus", "Ctrl+Shift+N"),
      s, EntryKind::Folder));
  c.push_back(std::make_unique<DeleteFilesCommand>(
      Describe("delete-files", "Delete Files", "Permanently delete the selected items", "trash",
               "Delete"),
      s));
  c.push_back(std::make_unique<RenameFileCommand>(
      Describe("rename-file", "Rename", "Rename the selected item", "edit", "F2"), s));
  c.push_back(std::make_unique<StageClipboardCommand>(
      Describe("copy-files", "Copy", "Copy the selected items to the clipboard", "copy", "Ctrl+C"), s,
      ClipboardOp::Copy));
  c.push_back(std::make_unique<StageClipboardCommand>(
      Describe("cut-files", "Cut", "Cut the selected items to the clipboard", "scissors", "Ctrl+X"),
      s, ClipboardOp::Cut));
  c.push_back(std::make_unique<PasteFilesCommand>(
      Describe("paste-files", "Paste", "Paste clipboard items into the current folder", "clipboard",
               "Ctrl+V"),
      s));
  c.push_back(std::make_unique<LoadDirectoryCommand>(
      Describe("load-directory", "Load Directory", "Open a directory in the current panel",
               "folder-open", "Ctrl+R"),
      s));
  c.push_back(std::make_unique<RefreshPanelCommand>(
      Describe("refresh-panel", "Refresh", "Reload the current folder", "refresh-cw", "F5"), s));
  c.push_back(std::make_unique<SelectionCommand>(
      Describe("select-all", "Select All", "Select every item in the current folder", nullptr,
               "Ctrl+A"),
      s, true));
  c.push_back(std::make_unique<SelectionCommand>(
      Describe("clear-selection", "Clear Selection", "Deselect all items", nullptr, "Escape"), s,
      false));
  c.push_back(std::make_unique<HandleDropCommand>(
      Describe("handle-drop", "Drop Files", "Drop dragged items into this panel", nullptr, nullptr),
      s));
  c.push_back(std::make_unique<CancelTransferCommand>(
      Describe("cancel-transfer", "Cancel Transfer", "Stop a running copy, move or delete", "x",
               nullptr),
      s));
  return c;
}

}  // namespace mosaic
