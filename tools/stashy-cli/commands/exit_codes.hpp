#pragma once

namespace stashy::cli {

// Standard exit codes for CLI commands
// Named with STASHY_ prefix to avoid conflict with system macros
constexpr int STASHY_EXIT_SUCCESS = 0;
constexpr int STASHY_EXIT_USER_ERROR = 1;     // Invalid arguments, validation errors
constexpr int STASHY_EXIT_NOT_FOUND = 2;      // Snippet/credential not found
constexpr int STASHY_EXIT_IO_ERROR = 3;       // Network/server/config/vault errors
constexpr int STASHY_EXIT_INTERNAL = 4;       // Internal/unexpected errors
constexpr int STASHY_EXIT_AUTH = 5;           // Not logged in or key rejected

}  // namespace stashy::cli
