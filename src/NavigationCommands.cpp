#include "CommandFactory.h"

namespace mosaic {

namespace {

class FocusAddressBarCommand final : public NavigationCommand {
public:
  using NavigationCommand::NavigationCommand;

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    services_.store.SetAddressBarActive(ctx.panelId, true);
    done(OkResult());
  }
};

// Jumps to a fixed location; aliases are resolved by the storage backend.
class GoToLocationCommand final : public NavigationCommand {
public:
  GoToLocationCommand(CommandDescriptor d, CommandServices& s, std::string target)
      : NavigationCommand(std::move(d), s), target_(std::move(target)) {}

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    NavigateTo(ctx, target_, std::move(done));
  }

private:
  std::string target_;
};

class GoToPathCommand final : public NavigationCommand {
public:
  using NavigationCommand::NavigationCommand;

  void Execute(const ExecutionContext& ctx, const CommandOptions& options, Completion done) override {
    const auto go = [this, ctx, done](const std::string& input) {
      const auto path = Trim(input);
      if (path.empty()) {
        done(ErrorResult(ErrorKind::Validation, "Path cannot be empty"));
        return;
      }
      NavigateTo(ctx, path, done);
    };

    if (options.path) {
      go(*options.path);
      return;
    }
    services_.dialogs.Prompt("Go to path:", ctx.currentPath,
                             [go, done](std::optional<std::string> answer) {
                               if (!answer) {
                                 done(CanceledResult("Navigation cancelled"));
                                 return;
                               }
                               go(*answer);
                             });
  }
};

class GoToParentCommand final : public NavigationCommand {
public:
  using NavigationCommand::NavigationCommand;

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions& options) const override {
    return NavigationCommand::CanExecute(ctx, options) && !ParentPath(ctx.currentPath).empty() &&
           NormalizeDir(ctx.currentPath) != "/";
  }

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    NavigateTo(ctx, ParentPath(ctx.currentPath), std::move(done));
  }
};

CommandDescriptor Describe(const char* id, const char* label, const char* description,
                           const char* icon, const char* shortcut) {
  return CommandDescriptor{
      .id = id,
      .label = label,
      .category = "Navigation",
      .description = std::string(description),
      .icon = std::string(icon),
      .shortcut = std::string(shortcut),
  };
}

}  // namespace

std::vector<std::unique_ptr<Command>> MakeNavigationCommands(CommandServices& s) {
  std::vector<std::unique_ptr<Command>> c;
  c.push_back(std::make_unique<FocusAddressBarCommand>(
      Describe("focus-address-bar", "Focus Address Bar", "Edit the path of the current panel",
               "edit-3", "Ctrl+L"),
      s));
  c.push_back(std::make_unique<GoToLocationCommand>(
      Describe("go-to-home", "Go to Home", "Open your home folder", "home", "Alt+Home"), s, "~"));
  c.push_back(std::make_unique<GoToLocationCommand>(
      Describe("go-to-documents", "Go to Documents", "Open your Documents folder", "file-text",
               "Alt+D"),
      s, "Documents"));
  c.push_back(std::make_unique<GoToLocationCommand>(
      Describe("go-to-desktop", "Go to Desktop", "Open your Desktop folder", "monitor",
               "Alt+Shift+D"),
      s, "Desktop"));
  c.push_back(std::make_unique<GoToLocationCommand>(
      Describe("go-to-downloads", "Go to Downloads", "Open your Downloads folder", "download",
               "Alt+Shift+L"),
      s, "Downloads"));
  c.push_back(std::make_unique<GoToLocationCommand>(
      Describe("go-to-applications", "Go to Applications", "Open the applications folder", "grid",
               "Alt+A"),
      s, "Applications"));
  c.push_back(std::make_unique<GoToPathCommand>(
      Describe("go-to-path", "Go to Path", "Type a path to open", "navigation", "Ctrl+G"), s));
  c.push_back(std::make_unique<GoToParentCommand>(
      Describe("go-to-parent", "Go to Parent", "Open the parent folder", "arrow-up", "Alt+Up"), s));
  return c;
}

}  // namespace mosaic
