#pragma once

#include "Logger/Logger.hpp"

namespace othello::console {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace othello::console
