#ifndef COFFER_UI_CLI_CONSOLEUTILS_HPP
#define COFFER_UI_CLI_CONSOLEUTILS_HPP

#include "coffer/security/SecureString.hpp"
#include <string>

namespace coffer::ui::cli
{

// Best effort: pins the pages mapped so far and disables core dumps. Returns false if either call was refused.
[[nodiscard]] bool lockProcessMemory() noexcept;

// Prompts on stdout and reads one line from stdin with terminal echo off.
[[nodiscard]] coffer::security::SecureString readPassword(const std::string& prompt);

} // namespace coffer::ui::cli

#endif // COFFER_UI_CLI_CONSOLEUTILS_HPP
