#include "console/command.hpp"

#include "core/notation.hpp"

#include <algorithm>
#include <cctype>

namespace othello::console {

static std::string trimmedLower(const std::string& line) {
	const auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };

	const auto begin = std::find_if_not(line.begin(), line.end(), isSpace);
	const auto end   = std::find_if_not(line.rbegin(), line.rend(), isSpace).base();
	if (begin >= end) {
		return {};
	}

	std::string out(begin, end);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
	return out;
}

std::optional<Command> parseCommand(const std::string& line, const KeyBindings& keys) {
	// Key bindings match the raw line, a bound space must not be trimmed away.
	if (line == keys.reset) {
		return GameEvent{ResetEvent{}};
	}
	if (line == keys.pass) {
		return GameEvent{PassEvent{}};
	}

	const auto word = trimmedLower(line);
	if (word.empty()) {
		return {};
	}
	// Non-blank bindings also match with surrounding whitespace.
	if (word == trimmedLower(keys.reset)) {
		return GameEvent{ResetEvent{}};
	}
	if (word == trimmedLower(keys.pass)) {
		return GameEvent{PassEvent{}};
	}
	if (word == "reset") {
		return GameEvent{ResetEvent{}};
	}
	if (word == "pass") {
		return GameEvent{PassEvent{}};
	}
	if (word == "quit" || word == "q") {
		return QuitCommand{};
	}

	if (const auto c = fromNotation(word)) {
		return GameEvent{CellClickEvent{*c}};
	}
	return {};
}

} // namespace othello::console
