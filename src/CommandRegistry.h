#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Command.h"

namespace mosaic {

// Immutable command table plus the dispatcher that runs entries from it.
class CommandRegistry final {
public:
  // Throws std::logic_error when two commands share an id.
  CommandRegistry(std::vector<std::unique_ptr<Command>> commands, PanelStore& store,
                  NotificationCenter& notifications);

  const Command* Find(const std::string& id) const;
  // Table order.
  std::vector<const Command*> All() const;
  std::vector<const Command*> Available(const ExecutionContext& ctx,
                                        const CommandOptions& options = {}) const;
  std::map<std::string, std::vector<const Command*>> ByCategory() const;

  // Case-insensitive match over label, description, category, shortcut and
  // id among the commands that can run now. Label matches come first.
  std::vector<const Command*> Search(const std::string& query, const ExecutionContext& ctx) const;

  ExecutionContext BuildContext(const CommandOptions& options = {});

  // Never throws. Unknown or unavailable commands produce a warning and a
  // validation result without side effects.
  void Dispatch(const std::string& id, const CommandOptions& options = {}, Completion done = {});

  int PendingDispatches() const { return pending_; }

private:
  void Report(const Command& command, const OpResult& result, const std::string& panelId);

  std::vector<std::unique_ptr<Command>> commands_;
  std::map<std::string, Command*> byId_;
  PanelStore& store_;
  NotificationCenter& notifications_;
  int pending_{0};
};

}  // namespace mosaic
