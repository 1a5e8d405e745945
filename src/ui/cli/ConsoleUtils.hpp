#ifndef STRONGBOX_UI_CLI_CONSOLEUTILS_HPP
#define STRONGBOX_UI_CLI_CONSOLEUTILS_HPP

#include "strongbox/security/SecureString.hpp"
#include <string>

namespace strongbox::ui::cli
{

// Keeps key material out of swap and core dumps. Returns false if either step was refused.
[[nodiscard]] bool lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo turned off (when stdin is a terminal).
[[nodiscard]] strongbox::security::SecureString readSecretLine(const std::string& prompt);

} // namespace strongbox::ui::cli

#endif // STRONGBOX_UI_CLI_CONSOLEUTILS_HPP
