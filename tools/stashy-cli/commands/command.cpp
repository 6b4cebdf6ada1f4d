#include "command.hpp"
#include "exit_codes.hpp"
#include "../interactive/prompt.hpp"

#include <stashy/snippet_draft.hpp>

namespace stashy::cli {

int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";

    switch (error.code()) {
        case ErrorCode::AUTH_REQUIRED:
            std::cerr << "Run 'stashy login <server-url>' first.\n";
            return STASHY_EXIT_AUTH;
        case ErrorCode::UNAUTHORIZED:
            std::cerr << "The API key is invalid or revoked. "
                         "Run 'stashy login <server-url>' to store a new one.\n";
            return STASHY_EXIT_AUTH;
        case ErrorCode::RATE_LIMITED:
            if (error.retry_after()) {
                std::cerr << "Retry after: " << *error.retry_after() << "\n";
            } else {
                std::cerr << "Wait a moment before trying again.\n";
            }
            return STASHY_EXIT_IO_ERROR;
        case ErrorCode::NOT_FOUND:
            return STASHY_EXIT_NOT_FOUND;
        case ErrorCode::VALIDATION_ERROR:
            return STASHY_EXIT_USER_ERROR;
        case ErrorCode::SERVER_ERROR:
            if (!error.body().empty()) {
                std::cerr << "Server response: " << truncate(error.body(), 500) << "\n";
            }
            return STASHY_EXIT_IO_ERROR;
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::TIMEOUT:
            std::cerr << "Check the server address and your connection.\n";
            return STASHY_EXIT_IO_ERROR;
        case ErrorCode::CONFIG_ERROR:
            std::cerr << "Fix or delete the config file, then log in again.\n";
            return STASHY_EXIT_IO_ERROR;
        case ErrorCode::CREDENTIAL_ERROR:
            std::cerr << "Make sure a Secret Service provider (GNOME Keyring, KWallet) is running.\n";
            return STASHY_EXIT_IO_ERROR;
        case ErrorCode::API_ERROR:
        case ErrorCode::INVALID_RESPONSE:
        case ErrorCode::IO_ERROR:
            return STASHY_EXIT_IO_ERROR;
        default:
            return STASHY_EXIT_INTERNAL;
    }
}

std::string join_categories(const std::set<std::string>& categories) {
    std::string out;
    for (const auto& c : categories) {
        if (!out.empty()) out += ", ";
        out += c;
    }
    return out;
}

std::optional<SnippetDraft> prompt_draft(const SnippetDraft& defaults) {
    SnippetDraft draft = defaults;

    auto title = prompt_line("Title", defaults.title);
    if (!title) return std::nullopt;
    draft.title = *title;

    auto description = prompt_line("Description (optional)", defaults.description);
    if (!description) return std::nullopt;
    draft.description = *description;

    auto is_public = confirm("Make the snippet public?",
                             defaults.visibility == Visibility::PUBLIC);
    if (!is_public) return std::nullopt;
    draft.visibility = *is_public ? Visibility::PUBLIC : Visibility::PRIVATE;

    auto categories = prompt_line("Categories (comma-separated)",
                                  join_categories(defaults.categories));
    if (!categories) return std::nullopt;
    draft.categories = parse_categories(*categories);

    return draft;
}

}  // namespace stashy::cli
