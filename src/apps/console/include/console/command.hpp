#pragma once

#include "console/appConfig.hpp"
#include "core/gameEvent.hpp"

#include <optional>
#include <string>
#include <variant>

namespace othello::console {

struct QuitCommand {};

using Command = std::variant<GameEvent, QuitCommand>;

//! Map one line of user input to a command.
//! Accepts a cell name ("d3"), the bound reset/pass keys, "reset", "pass" and "quit".
//! Returns empty if the line means nothing.
std::optional<Command> parseCommand(const std::string& line, const KeyBindings& keys);

} // namespace othello::console
