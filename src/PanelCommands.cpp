#include "CommandFactory.h"

#include <wx/log.h>

namespace mosaic {

namespace {

class SwitchToPanelCommand final : public Command {
public:
  SwitchToPanelCommand(CommandDescriptor d, CommandServices& s, std::string target)
      : Command(std::move(d)), services_(s), target_(std::move(target)) {}

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions&) const override {
    return ctx.panels.count(target_) != 0 && ctx.panelId != target_;
  }

  void Execute(const ExecutionContext&, const CommandOptions&, Completion done) override {
    services_.store.SetActivePanel(target_);
    done(OkResult());
  }

private:
  CommandServices& services_;
  std::string target_;
};

class SetLayoutCommand final : public Command {
public:
  SetLayoutCommand(CommandDescriptor d, CommandServices& s, GridLayout layout)
      : Command(std::move(d)), services_(s), layout_(std::move(layout)) {}

  bool CanExecute(const ExecutionContext&, const CommandOptions&) const override {
    const auto& current = services_.store.Layout();
    return current.rows != layout_.rows || current.cols != layout_.cols;
  }

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    if (!services_.store.SetGridLayout(layout_)) {
      done(ErrorResult(ErrorKind::Validation,
                       wxString::Format("Invalid layout %dx%d", layout_.rows, layout_.cols)));
      return;
    }

    // Panels created by the new layout start empty; give them a listing.
    for (const auto& id : services_.store.PanelOrder()) {
      if (ctx.panels.count(id) == 0) services_.loader.Load(id, services_.store.DefaultPath());
    }
    wxLogMessage("Layout switched to %s", layout_.name);
    done(OkResult());
  }

private:
  CommandServices& services_;
  GridLayout layout_;
};

}  // namespace

std::vector<std::unique_ptr<Command>> MakePanelCommands(CommandServices& s) {
  std::vector<std::unique_ptr<Command>> c;

  for (int n = 1; n <= 4; n++) {
    const auto id = "panel-" + std::to_string(n);
    c.push_back(std::make_unique<SwitchToPanelCommand>(
        CommandDescriptor{
            .id = "switch-to-" + id,
            .label = "Switch to Panel " + std::to_string(n),
            .category = "Panel",
            .description = "Make panel " + std::to_string(n) + " the active panel",
            .shortcut = "Ctrl+Alt+" + std::to_string(n),
        },
        s, id));
  }

  int key = 1;
  for (const auto& layout : PanelStore::PresetLayouts()) {
    const auto dims = std::to_string(layout.rows) + "x" + std::to_string(layout.cols);
    CommandDescriptor d{
        .id = "set-layout-" + dims,
        .label = "Layout: " + layout.name,
        .category = "Panel",
        .description = "Arrange panels in a " + dims + " grid",
        .icon = std::string("layout"),
    };
    if (key <= 3) d.shortcut = "Alt+" + std::to_string(key);
    key++;
    c.push_back(std::make_unique<SetLayoutCommand>(std::move(d), s, layout));
  }
  return c;
}

}  // namespace mosaic
