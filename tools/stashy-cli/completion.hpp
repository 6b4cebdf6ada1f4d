#pragma once

#include <optional>
#include <string>

namespace stashy::cli {

/**
 * Shell completion script for `shell` ("bash", "zsh" or "fish").
 * @return nullopt for an unknown shell
 */
std::optional<std::string> completion_script(const std::string& shell);

}  // namespace stashy::cli
