#ifndef COFFER_UI_CLI_COMMANDLINE_HPP
#define COFFER_UI_CLI_COMMANDLINE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coffer::ui::cli
{

// Splits a shell line into words. Single quotes are literal, double quotes honour \" and \\,
// a backslash outside quotes escapes the next character. Adjacent quoted parts join one word.
// Returns nullopt for an unterminated quote.
[[nodiscard]] std::optional<std::vector<std::string>> splitCommandLine(std::string_view line);

} // namespace coffer::ui::cli

#endif // COFFER_UI_CLI_COMMANDLINE_HPP
