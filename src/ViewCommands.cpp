#include "CommandFactory.h"

namespace mosaic {

namespace {

class SetViewModeCommand final : public Command {
public:
  SetViewModeCommand(CommandDescriptor d, CommandServices& s, ViewMode mode)
      : Command(std::move(d)), services_(s), mode_(mode) {}

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions&) const override {
    return ctx.HasPanel();
  }

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    services_.store.SetViewMode(ctx.panelId, mode_);
    done(OkResult());
  }

private:
  CommandServices& services_;
  ViewMode mode_;
};

// Picking the active field again flips the order.
class SortByCommand final : public Command {
public:
  SortByCommand(CommandDescriptor d, CommandServices& s, SortBy field)
      : Command(std::move(d)), services_(s), field_(field) {}

  bool CanExecute(const ExecutionContext& ctx, const CommandOptions&) const override {
    return ctx.HasPanel();
  }

  void Execute(const ExecutionContext& ctx, const CommandOptions&, Completion done) override {
    services_.store.SetSorting(ctx.panelId, field_);
    done(OkResult());
  }

private:
  CommandServices& services_;
  SortBy field_;
};

CommandDescriptor Describe(const std::string& id, const std::string& label,
                           const std::string& description, const std::string& shortcut) {
  return CommandDescriptor{
      .id = id,
      .label = label,
      .category = "View",
      .description = description,
      .shortcut = shortcut,
  };
}

}  // namespace

std::vector<std::unique_ptr<Command>> MakeViewCommands(CommandServices& s) {
  std::vector<std::unique_ptr<Command>> c;

  const struct {
    ViewMode mode;
    const char* label;
  } views[] = {{ViewMode::List, "List"}, {ViewMode::Grid, "Grid"}, {ViewMode::Details, "Details"}};
  int key = 1;
  for (const auto& v : views) {
    c.push_back(std::make_unique<SetViewModeCommand>(
        Describe(std::string("set-view-") + ViewModeName(v.mode), std::string(v.label) + " View",
                 std::string("Show items as a ") + ToLower(v.label) + " view",
                 "Ctrl+" + std::to_string(key++)),
        s, v.mode));
  }

  const struct {
    SortBy field;
    const char* label;
  } sorts[] = {{SortBy::Name, "Name"},
               {SortBy::Size, "Size"},
               {SortBy::Modified, "Modified"},
               {SortBy::Type, "Type"}};
  key = 1;
  for (const auto& sort : sorts) {
    c.push_back(std::make_unique<SortByCommand>(
        Describe(std::string("sort-by-") + SortByName(sort.field), std::string("Sort by ") + sort.label,
                 std::string("Order items by ") + ToLower(sort.label),
                 "Ctrl+Shift+" + std::to_string(key++)),
        s, sort.field));
  }
  return c;
}

}  // namespace mosaic
