#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "DialogService.h"
#include "Workspace.h"

namespace mosaic {

// Prompts are printed and answered by the next input line. An empty answer
// takes the default and "." dismisses the prompt.
class ConsoleDialogService final : public DialogService {
public:
  explicit ConsoleDialogService(std::ostream& out) : out_(out) {}

  void Prompt(const std::string& message, const std::string& defaultValue, PromptDone done) override;
  void Confirm(const std::string& message, ConfirmDone done) override;

  bool HasPending() const { return pendingPrompt_ || pendingConfirm_; }
  void Answer(const std::string& line);

private:
  std::ostream& out_;
  PromptDone pendingPrompt_;
  std::string pendingDefault_;
  ConfirmDone pendingConfirm_;
};

// Splits a line on whitespace; double quotes group words.
std::vector<std::string> Tokenize(const std::string& line);

// Parses "key=value" arguments of the `run` command.
bool ParseCommandOptions(const std::vector<std::string>& args, CommandOptions* options,
                         std::string* error);

// Line-oriented front end translating text commands into store calls,
// dispatches and drag transitions.
class ConsoleShell final {
public:
  ConsoleShell(Workspace& workspace, ConsoleDialogService& dialogs, std::ostream& out);

  // Returns false once the user asked to quit.
  bool HandleLine(const std::string& line);
  bool QuitRequested() const { return quit_; }

  void PrintHelp();
  void PrintState();

private:
  void PrintPanel(const Panel& panel, bool active);
  void RunCommand(const std::string& id, const CommandOptions& options);

  Workspace& workspace_;
  ConsoleDialogService& dialogs_;
  std::ostream& out_;
  bool quit_{false};
};

}  // namespace mosaic
