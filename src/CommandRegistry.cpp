#include "CommandRegistry.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include <wx/log.h>

namespace mosaic {

CommandRegistry::CommandRegistry(std::vector<std::unique_ptr<Command>> commands, PanelStore& store,
                                 NotificationCenter& notifications)
    : commands_(std::move(commands)), store_(store), notifications_(notifications) {
  for (const auto& c : commands_) {
    if (!byId_.emplace(c->Id(), c.get()).second) {
      throw std::logic_error("Duplicate command id: " + c->Id());
    }
  }
  wxLogDebug("Registered %zu commands", commands_.size());
}

const Command* CommandRegistry::Find(const std::string& id) const {
  const auto it = byId_.find(id);
  return it == byId_.end() ? nullptr : it->second;
}

std::vector<const Command*> CommandRegistry::All() const {
  std::vector<const Command*> out;
  out.reserve(commands_.size());
  for (const auto& c : commands_) out.push_back(c.get());
  return out;
}

std::vector<const Command*> CommandRegistry::Available(const ExecutionContext& ctx,
                                                       const CommandOptions& options) const {
  std::vector<const Command*> out;
  for (const auto& c : commands_) {
    if (c->CanExecute(ctx, options)) out.push_back(c.get());
  }
  return out;
}

std::map<std::string, std::vector<const Command*>> CommandRegistry::ByCategory() const {
  std::map<std::string, std::vector<const Command*>> out;
  for (const auto& c : commands_) out[c->Descriptor().category].push_back(c.get());
  return out;
}

std::vector<const Command*> CommandRegistry::Search(const std::string& query,
                                                    const ExecutionContext& ctx) const {
  auto candidates = Available(ctx);
  if (Trim(query).empty()) return candidates;
  // Surrounding spaces stay part of the term, so " file" only matches at a word start.
  const auto needle = ToLower(query);

  std::vector<const Command*> matches;
  for (const auto* c : candidates) {
    const auto& d = c->Descriptor();
    const auto haystack = d.label + " " + d.description.value_or("") + " " + d.category + " " +
                          d.shortcut.value_or("") + " " + d.id;
    if (ContainsNoCase(haystack, needle)) matches.push_back(c);
  }

  std::stable_sort(matches.begin(), matches.end(), [&](const Command* a, const Command* b) {
    const bool la = ContainsNoCase(a->Descriptor().label, needle);
    const bool lb = ContainsNoCase(b->Descriptor().label, needle);
    if (la != lb) return la;
    return a->Descriptor().category < b->Descriptor().category;
  });
  return matches;
}

ExecutionContext CommandRegistry::BuildContext(const CommandOptions& options) {
  ExecutionContext ctx;
  if (options.panelId) {
    ctx.panelId = *options.panelId;
  } else if (store_.ActivePanelId()) {
    ctx.panelId = *store_.ActivePanelId();
  }

  if (const auto* panel = store_.GetPanel(ctx.panelId)) {
    ctx.currentPath = panel->currentPath;
    ctx.selectedFiles = ResolveSelection(*panel);
  }
  ctx.clipboard = store_.Clipboard();
  ctx.drag = store_.Drag();
  ctx.panels = store_.Panels();
  ctx.dispatch = [this](const std::string& id, const CommandOptions& opts, Completion done) {
    Dispatch(id, opts, std::move(done));
  };
  return ctx;
}

void CommandRegistry::Dispatch(const std::string& id, const CommandOptions& options, Completion done) {
  auto* command = byId_.count(id) ? byId_.at(id) : nullptr;
  if (!command) {
    wxLogWarning("Unknown command '%s'", id);
    const auto res = ErrorResult(ErrorKind::Validation, wxString::Format("Unknown command: %s", id));
    notifications_.Warning(res.message.ToStdString());
    if (done) done(res);
    return;
  }

  const auto ctx = BuildContext(options);
  bool runnable = false;
  try {
    runnable = command->CanExecute(ctx, options);
  } catch (const std::exception& e) {
    wxLogError("Availability check for '%s' threw: %s", id, e.what());
  }
  if (!runnable) {
    wxLogDebug("Command '%s' is not available for panel '%s'", id, ctx.panelId);
    const auto res = ErrorResult(
        ErrorKind::Validation,
        wxString::Format("%s is not available right now", command->Descriptor().label));
    notifications_.Warning(res.message.ToStdString(), ctx.panelId.empty()
                                                          ? std::nullopt
                                                          : std::optional<std::string>(ctx.panelId));
    if (done) done(res);
    return;
  }

  wxLogDebug("Dispatching '%s' on panel '%s'", id, ctx.panelId);
  pending_++;
  auto settled = std::make_shared<bool>(false);
  const auto panelId = ctx.panelId;
  Completion finish = [this, command, panelId, settled, done](const OpResult& result) {
    if (*settled) {
      wxLogWarning("Command '%s' completed more than once", command->Id());
      return;
    }
    *settled = true;
    pending_--;
    Report(*command, result, panelId);
    if (done) done(result);
  };

  try {
    command->Execute(ctx, options, finish);
  } catch (const std::exception& e) {
    wxLogError("Command '%s' threw: %s", id, e.what());
    finish(ErrorResult(ErrorKind::Runtime, wxString::FromUTF8(e.what())));
  }
}

void CommandRegistry::Report(const Command& command, const OpResult& result, const std::string& panelId) {
  const auto scope = panelId.empty() ? std::nullopt : std::optional<std::string>(panelId);

  switch (result.code) {
    case OpCode::Ok:
    case OpCode::Skipped:
      wxLogDebug("Command '%s' finished", command.Id());
      return;
    case OpCode::Cancelled:
      wxLogMessage("Command '%s' cancelled: %s", command.Id(), result.message);
      if (!result.reported) {
        notifications_.Info(result.message.empty() ? command.Descriptor().label + " cancelled"
                                                   : result.message.ToStdString(),
                            scope);
      }
      return;
    case OpCode::Error:
      break;
  }

  wxLogWarning("Command '%s' failed (%s): %s", command.Id(), ErrorKindName(result.kind), result.message);
  if (result.reported) return;
  if (result.kind == ErrorKind::Validation) {
    notifications_.Warning(result.message.ToStdString(), scope);
  } else {
    notifications_.Error(command.ErrorPrefix() + ": " + result.message.ToStdString(), scope);
  }
}

}  // namespace mosaic
