#ifndef NOPASSPLZ_UI_CLI_CONSOLEUTILS_HPP
#define NOPASSPLZ_UI_CLI_CONSOLEUTILS_HPP

#include "nopassplz/security/SecureString.hpp"
#include <string>

namespace nopassplz::ui::cli
{

// Keeps secrets out of swap and core dumps. Returns false if either step was refused.
[[nodiscard]] bool lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo disabled.
[[nodiscard]] nopassplz::security::SecureString readPassword(const std::string& prompt);

} // namespace nopassplz::ui::cli

#endif // NOPASSPLZ_UI_CLI_CONSOLEUTILS_HPP
