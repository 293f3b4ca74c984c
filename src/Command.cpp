#include "Command.h"

#include "CommandFactory.h"

namespace mosaic {

bool Command::CanExecute(const ExecutionContext&, const CommandOptions&) const { return true; }

std::string Command::ErrorPrefix() const { return "Failed to " + ToLower(descriptor_.label); }

FileOperationCommand::FileOperationCommand(CommandDescriptor descriptor, CommandServices& services,
                                           size_t minSelection, std::optional<size_t> maxSelection)
    : Command(std::move(descriptor)),
      services_(services),
      minSelection_(minSelection),
      maxSelection_(maxSelection) {}

bool FileOperationCommand::CanExecute(const ExecutionContext& ctx, const CommandOptions&) const {
  if (!ctx.HasPanel()) return false;
  const auto n = ctx.selectedFiles.size();
  if (n < minSelection_) return false;
  return !maxSelection_ || n <= *maxSelection_;
}

std::string FileOperationCommand::ConfirmationMessage(const ExecutionContext& ctx) const {
  return wxString::Format("%s %zu item(s)?", Descriptor().label, ctx.selectedFiles.size())
      .ToStdString();
}

bool NavigationCommand::CanExecute(const ExecutionContext& ctx, const CommandOptions&) const {
  return ctx.HasPanel();
}

void NavigationCommand::NavigateTo(const ExecutionContext& ctx, const std::string& target,
                                   Completion done) {
  services_.store.SetAddressBarActive(ctx.panelId, false);
  services_.loader.Load(ctx.panelId, target, std::move(done));
}

OpResult ResultFromReport(const BatchReport& report) {
  OpResult r;
  switch (report.state) {
    case BatchState::Completed:
      r = OkResult();
      break;
    case BatchState::PartiallyFailed:
    case BatchState::Failed:
      r = ErrorResult(ErrorKind::Backend,
                      wxString::Format("%zu of %d items failed", report.errors.size(), report.total));
      break;
    case BatchState::Cancelled:
      r = CanceledResult("Transfer cancelled");
      break;
    case BatchState::InFlight:
      r = ErrorResult(ErrorKind::Runtime, "Batch reported before it finished");
      break;
  }
  r.reported = true;
  return r;
}

std::vector<std::unique_ptr<Command>> MakeAllCommands(CommandServices& services) {
  std::vector<std::unique_ptr<Command>> all;
  for (auto* make : {&MakeFileCommands, &MakeNavigationCommands, &MakeViewCommands,
                     &MakePanelCommands}) {
    for (auto& c : make(services)) all.push_back(std::move(c));
  }
  return all;
}

}  // namespace mosaic
