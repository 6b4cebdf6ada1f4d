#pragma once

#include <stashy/session.hpp>
#include <stashy/snippet_service.hpp>
#include <stashy/util/logger.hpp>
#include <CLI/CLI.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace stashy::cli {

/**
 * Context passed to command execution.
 * Contains the restored session and the service built on it.
 */
struct CommandContext {
    Session* session = nullptr;
    SnippetService* service = nullptr;
    Logger* logger = nullptr;
    bool verbose = false;
    std::filesystem::path config_path;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with session and service
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "create", "get").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Parse a snippet ID from string.
 * Returns nullopt if not a valid positive integer.
 */
inline std::optional<SnippetId> parse_snippet_id(const std::string& str) {
    if (str.empty()) return std::nullopt;

    char* end = nullptr;
    errno = 0;
    unsigned long long val = std::strtoull(str.c_str(), &end, 10);

    if (end == str.c_str() || *end != '\0' || str[0] == '-') {
        return std::nullopt;
    }

    if (errno == ERANGE || val == 0) {
        return std::nullopt;
    }

    return static_cast<SnippetId>(val);
}

/**
 * Truncate a string for display, adding "..." if needed.
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

/**
 * Print an error with a hint on how to fix it.
 * @return The exit code matching the error
 */
int report_error(const Error& error);

/**
 * Ask for title, description, visibility and categories, starting from the
 * values in `defaults`. Files are taken from `defaults` unchanged.
 *
 * @return The filled draft, or nullopt if input ended early
 */
std::optional<SnippetDraft> prompt_draft(const SnippetDraft& defaults);

// Categories joined with ", "
std::string join_categories(const std::set<std::string>& categories);

}  // namespace stashy::cli
