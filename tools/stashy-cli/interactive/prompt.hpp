#pragma once

#include <optional>
#include <string>

namespace stashy::cli {

/**
 * Line-oriented prompts on stdin/stdout.
 *
 * Each returns nullopt when stdin is closed (EOF), so commands can abort
 * instead of submitting half-filled input.
 */

// "Label [default]: " - empty answer yields the default
std::optional<std::string> prompt_line(const std::string& label,
                                       const std::string& default_value = "");

// Input with echo disabled when stdin is a terminal
std::optional<std::string> prompt_secret(const std::string& label);

// "Label [y/N]: "
std::optional<bool> confirm(const std::string& label, bool default_value = false);

bool stdin_is_terminal();

}  // namespace stashy::cli
