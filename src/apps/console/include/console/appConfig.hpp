#pragma once

#include "core/gameConfig.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace othello::console {

//! Input lines mapped to the reset and pass signals.
struct KeyBindings {
	std::string reset{" "};
	std::string pass{"s"};
};

//! Settings of the console front end.
struct AppConfig {
	GameConfig game;            //!< Rule policies handed to the core.
	KeyBindings keys;           //!< Key bindings for reset and pass.
	bool showCoordinates{true}; //!< Print column letters and row digits around the board.
};

//! Parse a JSON settings document. Missing fields keep their defaults.
//! Returns empty on malformed JSON or fields of the wrong type.
std::optional<AppConfig> parseConfig(const std::string& content);

//! Load settings from a file. A missing file yields the defaults.
std::optional<AppConfig> loadConfig(const std::filesystem::path& path);

} // namespace othello::console
