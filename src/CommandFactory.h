#pragma once

#include <memory>
#include <vector>

#include "Command.h"

namespace mosaic {

std::vector<std::unique_ptr<Command>> MakeFileCommands(CommandServices& services);
std::vector<std::unique_ptr<Command>> MakeNavigationCommands(CommandServices& services);
std::vector<std::unique_ptr<Command>> MakeViewCommands(CommandServices& services);
std::vector<std::unique_ptr<Command>> MakePanelCommands(CommandServices& services);

// The full command table in display order.
std::vector<std::unique_ptr<Command>> MakeAllCommands(CommandServices& services);

}  // namespace mosaic
