#include "Logging.hpp"
#include "console/appConfig.hpp"
#include "console/command.hpp"
#include "console/consoleRenderer.hpp"
#include "core/game.hpp"

#include <format>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
	using namespace othello;
	using namespace othello::console;

	const std::filesystem::path configPath = argc > 1 ? argv[1] : "othello.json";
	const auto config                      = loadConfig(configPath);
	if (!config) {
		std::cerr << std::format("Invalid settings file '{}'.\n", configPath.string());
		return 1;
	}

	Game game(config->game);
	ConsoleRenderer renderer(game, std::cout, config->showCoordinates);
	renderer.render();

	std::cout << std::format("Enter a cell (e.g. d3), '{}' to pass, reset or quit.\n", config->keys.pass);

	auto logger = Logger();
	std::string line;
	while (std::getline(std::cin, line)) {
		const auto command = parseCommand(line, config->keys);
		if (!command) {
			logger.Log(Logging::LogLevel::Warning, std::format("[Console] Unknown input '{}'.", line));
			std::cout << "Unknown input.\n";
			continue;
		}

		if (std::holds_alternative<QuitCommand>(*command)) {
			break;
		}
		game.processEvent(std::get<GameEvent>(*command));
	}

	logger.Log(Logging::LogLevel::Info, "[Console] Session ended.");
	logger.Flush();
	return 0;
}
