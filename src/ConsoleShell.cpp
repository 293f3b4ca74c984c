#include "ConsoleShell.h"

#include <exception>

#include <wx/log.h>

namespace mosaic {

namespace {

constexpr size_t kListedFiles = 12;

const char* TypeGlyph(FileType type) {
  switch (type) {
    case FileType::Directory: return "d";
    case FileType::Symlink: return "l";
    case FileType::File: return "-";
  }
  return "-";
}

bool ParseLayout(const std::string& s, int* rows, int* cols) {
  const auto x = ToLower(s).find('x');
  if (x == std::string::npos) return false;
  try {
    *rows = std::stoi(s.substr(0, x));
    *cols = std::stoi(s.substr(x + 1));
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

}  // namespace

void ConsoleDialogService::Prompt(const std::string& message, const std::string& defaultValue,
                                  PromptDone done) {
  if (HasPending()) {
    wxLogWarning("A prompt is already open; dismissing \"%s\"", message);
    done(std::nullopt);
    return;
  }
  out_ << "? " << message << " [" << defaultValue << "] (\".\" to cancel)" << std::endl;
  pendingPrompt_ = std::move(done);
  pendingDefault_ = defaultValue;
}

void ConsoleDialogService::Confirm(const std::string& message, ConfirmDone done) {
  if (HasPending()) {
    wxLogWarning("A prompt is already open; declining \"%s\"", message);
    done(false);
    return;
  }
  out_ << "? " << message << " [y/N]" << std::endl;
  pendingConfirm_ = std::move(done);
}

void ConsoleDialogService::Answer(const std::string& line) {
  const auto answer = Trim(line);

  // Handlers may open the next prompt from inside the callback.
  if (pendingPrompt_) {
    auto done = std::move(pendingPrompt_);
    pendingPrompt_ = nullptr;
    if (answer == ".") {
      done(std::nullopt);
    } else {
      done(answer.empty() ? pendingDefault_ : answer);
    }
    return;
  }
  if (pendingConfirm_) {
    auto done = std::move(pendingConfirm_);
    pendingConfirm_ = nullptr;
    const auto lower = ToLower(answer);
    done(lower == "y" || lower == "yes");
  }
}

std::vector<std::string> Tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::string cur;
  bool inQuotes = false;
  bool hasToken = false;
  for (const char c : line) {
    if (c == '"') {
      inQuotes = !inQuotes;
      hasToken = true;
      continue;
    }
    if (!inQuotes && (c == ' ' || c == '\t')) {
      if (hasToken) tokens.push_back(cur);
      cur.clear();
      hasToken = false;
      continue;
    }
    cur.push_back(c);
    hasToken = true;
  }
  if (hasToken) tokens.push_back(cur);
  return tokens;
}

bool ParseCommandOptions(const std::vector<std::string>& args, CommandOptions* options,
                         std::string* error) {
  for (const auto& arg : args) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos) {
      if (error) *error = "Expected key=value, got '" + arg + "'";
      return false;
    }
    const auto key = arg.substr(0, eq);
    const auto value = arg.substr(eq + 1);
    if (key == "panel") options->panelId = value;
    else if (key == "path") options->path = value;
    else if (key == "newName") options->newName = value;
    else if (key == "name") options->name = value;
    else if (key == "transfer") options->transferId = value;
    else if (key == "navigate") options->navigateToTarget = value == "1" || ToLower(value) == "true";
    else {
      if (error) *error = "Unknown option '" + key + "'";
      return false;
    }
  }
  return true;
}

ConsoleShell::ConsoleShell(Workspace& workspace, ConsoleDialogService& dialogs, std::ostream& out)
    : workspace_(workspace), dialogs_(dialogs), out_(out) {
  workspace_.Notifications().BindNotified([this](const Notification& n) {
    out_ << "[" << SeverityName(n.severity) << "] " << n.message;
    if (n.panelId) out_ << " (" << *n.panelId << ")";
    out_ << std::endl;
  });
}

void ConsoleShell::PrintHelp() {
  out_ << "Commands:\n"
          "  show                       print panels, clipboard, drag and progress\n"
          "  layout RxC                 change the grid\n"
          "  activate PANEL             make PANEL active\n"
          "  cd PATH                    open PATH in the active panel\n"
          "  select NAME...             replace the selection\n"
          "  toggle NAME...             toggle names in the selection\n"
          "  run ID [key=value...]      dispatch a command (panel, path, name, newName, transfer, navigate)\n"
          "  commands [QUERY]           list or search available commands\n"
          "  drag PANEL NAME [copy]     start dragging from PANEL\n"
          "  hover PANEL [copy]         move the drag over PANEL\n"
          "  drop PANEL                 drop onto PANEL\n"
          "  enddrag                    abandon the drag\n"
          "  cancel ID                  cancel a running transfer\n"
          "  dismiss ID                 dismiss a notification\n"
          "  quit\n";
  out_.flush();
}

void ConsoleShell::PrintPanel(const Panel& panel, bool active) {
  out_ << (active ? "* " : "  ") << panel.id << "  " << panel.currentPath << "  [" << ViewModeName(panel.viewMode)
       << ", " << SortByName(panel.sortBy) << (panel.sortOrder == SortOrder::Asc ? " asc" : " desc") << "]";
  if (panel.isLoading) out_ << "  loading";
  if (panel.error) out_ << "  error: " << *panel.error;
  out_ << "\n";

  const auto files = SortedFiles(panel);
  size_t shown = 0;
  for (const auto& f : files) {
    if (shown++ >= kListedFiles) {
      out_ << "      ... " << files.size() - kListedFiles << " more\n";
      break;
    }
    out_ << "    " << (panel.selectedFiles.count(f.name) ? "+" : " ") << TypeGlyph(f.type) << " " << f.name;
    if (f.type == FileType::File) out_ << "  " << HumanSize(f.size);
    if (!f.modified.empty()) out_ << "  " << f.modified;
    out_ << "\n";
  }
}

void ConsoleShell::PrintState() {
  auto& store = workspace_.Store();
  out_ << "Layout " << store.Layout().name << "\n";
  for (const auto& id : store.PanelOrder()) {
    if (const auto* p = store.GetPanel(id)) PrintPanel(*p, store.ActivePanelId() == id);
  }

  const auto& clip = store.Clipboard();
  if (clip.hasFiles) {
    out_ << "Clipboard: " << (clip.operation == ClipboardOp::Cut ? "cut" : "copy") << " " << clip.files.size()
         << " item(s) from " << clip.sourcePanelId << "\n";
  }
  const auto& drag = store.Drag();
  if (drag.isDragging) {
    out_ << "Dragging " << drag.draggedFiles.size() << " item(s) from " << drag.sourcePanelId << " ("
         << TransferOpName(drag.operation) << ")\n";
  }
  for (const auto& r : workspace_.Notifications().Progress()) {
    out_ << "Progress " << r.id << ": " << r.currentFile << "/" << r.totalFiles << " " << r.percentage << "% "
         << BatchStateName(r.state);
    if (!r.fileName.empty()) out_ << " (" << r.fileName << ")";
    out_ << "\n";
  }
  for (const auto& n : workspace_.Notifications().All()) {
    out_ << "Notification " << n.id << " [" << SeverityName(n.severity) << "] " << n.message << "\n";
  }
  out_.flush();
}

void ConsoleShell::RunCommand(const std::string& id, const CommandOptions& options) {
  workspace_.Dispatch(id, options, [this, id](const OpResult& result) {
    if (result.ok()) out_ << "ok: " << id << std::endl;
  });
}

bool ConsoleShell::HandleLine(const std::string& line) {
  if (dialogs_.HasPending()) {
    dialogs_.Answer(line);
    return true;
  }

  const auto tokens = Tokenize(line);
  if (tokens.empty()) return true;
  const auto& verb = tokens[0];
  const std::vector<std::string> args(tokens.begin() + 1, tokens.end());
  auto& store = workspace_.Store();
  const auto active = store.ActivePanelId().value_or("");

  if (verb == "quit" || verb == "exit") {
    quit_ = true;
    return false;
  }
  if (verb == "help") {
    PrintHelp();
  } else if (verb == "show") {
    PrintState();
  } else if (verb == "layout" && args.size() == 1) {
    int rows = 0;
    int cols = 0;
    if (!ParseLayout(args[0], &rows, &cols)) {
      out_ << "Expected RxC, e.g. 2x2" << std::endl;
      return true;
    }
    const auto id = "set-layout-" + std::to_string(rows) + "x" + std::to_string(cols);
    if (workspace_.Commands().Find(id)) {
      RunCommand(id, {});
      return true;
    }
    const auto before = store.Panels();
    if (!store.SetGridLayout({.rows = rows, .cols = cols})) {
      out_ << "Invalid layout " << args[0] << std::endl;
      return true;
    }
    for (const auto& panelId : store.PanelOrder()) {
      if (before.count(panelId) == 0) workspace_.Loader().Load(panelId, store.DefaultPath());
    }
  } else if (verb == "activate" && args.size() == 1) {
    store.SetActivePanel(args[0]);
  } else if (verb == "cd" && args.size() == 1) {
    RunCommand("go-to-path", {.path = args[0]});
  } else if ((verb == "select" || verb == "toggle") && !active.empty()) {
    store.SelectFiles(active, args, verb == "toggle");
  } else if (verb == "run" && !args.empty()) {
    CommandOptions options;
    std::string error;
    if (!ParseCommandOptions(std::vector<std::string>(args.begin() + 1, args.end()), &options,
                             &error)) {
      out_ << error << std::endl;
      return true;
    }
    RunCommand(args[0], options);
  } else if (verb == "commands") {
    std::string query;
    for (const auto& a : args) query += (query.empty() ? "" : " ") + a;
    auto& registry = workspace_.Commands();
    for (const auto* c : registry.Search(query, registry.BuildContext())) {
      const auto& d = c->Descriptor();
      out_ << "  " << d.id << "  " << d.label << "  (" << d.category << ")";
      if (d.shortcut) out_ << "  " << *d.shortcut;
      out_ << "\n";
    }
    out_.flush();
  } else if (verb == "drag" && args.size() >= 2) {
    const bool copy = args.size() >= 3 && args[2] == "copy";
    if (!workspace_.Transfers().StartDrag(args[0], args[1], copy)) {
      out_ << "Nothing named " << args[1] << " in " << args[0] << std::endl;
    }
  } else if (verb == "hover" && !args.empty()) {
    workspace_.Transfers().UpdateDragOperation(args[0], args.size() >= 2 && args[1] == "copy");
  } else if (verb == "drop" && args.size() == 1) {
    RunCommand("handle-drop", {.panelId = args[0]});
  } else if (verb == "enddrag") {
    workspace_.Transfers().EndDrag();
  } else if (verb == "cancel" && args.size() == 1) {
    RunCommand("cancel-transfer", {.transferId = args[0]});
  } else if (verb == "dismiss" && args.size() == 1) {
    workspace_.Notifications().Dismiss(args[0]);
  } else {
    out_ << "Unknown input: " << line << " (try \"help\")" << std::endl;
  }
  return true;
}

}  // namespace mosaic
