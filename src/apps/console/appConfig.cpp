#include "console/appConfig.hpp"

#include "Logging.hpp"

#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <type_traits>

namespace othello::console {

using nlohmann::json;

//! Read an optional field into out. Returns false if the field exists with a different type.
template <class T>
static bool readField(const json& object, const char* key, T& out) {
	const auto it = object.find(key);
	if (it == object.end()) {
		return true;
	}

	if constexpr (std::is_same_v<T, bool>) {
		if (!it->is_boolean())
			return false;
	} else {
		if (!it->is_string() || it->get_ref<const std::string&>().empty())
			return false;
	}

	out = it->get<T>();
	return true;
}

std::optional<AppConfig> parseConfig(const std::string& content) {
	const auto document = json::parse(content, nullptr, false);
	if (document.is_discarded() || !document.is_object()) {
		return {};
	}

	AppConfig config{};
	if (!readField(document, "freezeOnGameOver", config.game.freezeOnGameOver) || !readField(document, "showCoordinates", config.showCoordinates)) {
		return {};
	}

	if (const auto keys = document.find("keys"); keys != document.end()) {
		if (!keys->is_object() || !readField(*keys, "reset", config.keys.reset) || !readField(*keys, "pass", config.keys.pass)) {
			return {};
		}
	}

	if (config.keys.reset == config.keys.pass) {
		return {};
	}
	return config;
}

std::optional<AppConfig> loadConfig(const std::filesystem::path& path) {
	auto logger = Logger();

	std::error_code ec{};
	if (!std::filesystem::exists(path, ec)) {
		logger.Log(Logging::LogLevel::Info, std::format("[Config] No settings file at '{}'. Using defaults.", path.string()));
		return AppConfig{};
	}

	std::ifstream file(path);
	if (!file) {
		logger.Log(Logging::LogLevel::Error, std::format("[Config] Could not open '{}'.", path.string()));
		return {};
	}

	std::stringstream content;
	content << file.rdbuf();

	auto config = parseConfig(content.str());
	if (!config) {
		logger.Log(Logging::LogLevel::Error, std::format("[Config] Invalid settings in '{}'.", path.string()));
		return {};
	}

	logger.Log(Logging::LogLevel::Info, std::format("[Config] Loaded settings from '{}'.", path.string()));
	return config;
}

} // namespace othello::console
