#pragma once

#include <stashy/result.hpp>
#include <stashy/types.hpp>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace stashy {

/**
 * Check a draft before submission.
 * Requires a non-blank title, at least one file and a filename on every file.
 *
 * @return VALIDATION_ERROR naming the first missing field
 */
Result<void> validate_draft(const SnippetDraft& draft);

/**
 * Read a local file into a SnippetFile.
 * Paths with a ".." component are rejected, and the language is
 * detected from the filename and shebang.
 */
Result<SnippetFile> load_snippet_file(const std::filesystem::path& path);

// Load several files, failing on the first bad path. Order is preserved.
Result<std::vector<SnippetFile>> load_snippet_files(const std::vector<std::string>& paths);

/**
 * Write each file of a snippet into dir, creating it if needed.
 * Every filename is checked before anything is written: names with a path
 * separator or ".." fail with INVALID_RESPONSE and leave dir untouched.
 *
 * @return Paths written, in snippet order
 */
Result<std::vector<std::filesystem::path>> write_snippet_files(const Snippet& snippet,
                                                               const std::filesystem::path& dir);

// Split "a, b,,c" into {"a", "b", "c"}
std::set<std::string> parse_categories(const std::string& comma_separated);

}  // namespace stashy
