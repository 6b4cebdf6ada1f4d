#include "create_command.hpp"

#include <stashy/snippet_draft.hpp>

namespace stashy::cli {

namespace {

void print_saved(const char* verb, const Snippet& snippet, const std::string& server_url) {
    std::cout << verb << " snippet " << snippet.id << " \"" << snippet.title << "\" ("
              << snippet.files.size() << " file(s), " << visibility_name(snippet.visibility)
              << ")\n";
    if (!server_url.empty()) {
        std::cout << "Server: " << server_url << "\n";
    }
}

}  // namespace

// ============================================================================
// create
// ============================================================================

void CreateCommand::setup(CLI::App& app) {
    app.add_option("files", files_, "Files to upload")
        ->type_name("<file>...");

    app.add_option("-t,--title", title_, "Snippet title (defaults to the first filename)")
        ->type_name("<title>");

    app.add_option("-d,--desc", desc_, "Description")
        ->type_name("<text>");

    app.add_option("-c,--categories", categories_, "Comma-separated categories")
        ->type_name("<a,b,c>");

    app.add_flag("--public", public_, "Make the snippet public");

    app.add_flag("-y,--yes", no_prompt_, "Do not prompt; use options and defaults");
}

int CreateCommand::execute(CommandContext& ctx) {
    if (files_.empty()) {
        std::cerr << "Error: Provide at least one file.\n";
        std::cerr << "Usage: stashy create <file>... [-t title] [-d desc] [-c categories]\n";
        return STASHY_EXIT_USER_ERROR;
    }
    if (!ctx.session->is_authenticated()) {
        return report_error(Error(ErrorCode::AUTH_REQUIRED, "Not logged in"));
    }

    auto files = load_snippet_files(files_);
    if (!files.ok()) {
        return report_error(files.error());
    }

    SnippetDraft draft;
    draft.files = std::move(files.value());
    draft.title = title_.empty() ? draft.files.front().filename : title_;
    draft.description = desc_;
    draft.visibility = public_ ? Visibility::PUBLIC : Visibility::PRIVATE;
    draft.categories = parse_categories(categories_);

    if (!no_prompt_) {
        auto prompted = prompt_draft(draft);
        if (!prompted) {
            std::cerr << "Cancelled.\n";
            return STASHY_EXIT_USER_ERROR;
        }
        draft = std::move(*prompted);
    }

    auto created = ctx.service->create(draft);
    if (!created.ok()) {
        return report_error(created.error());
    }

    print_saved("Created", created.value(), ctx.session->config().server_url);
    return STASHY_EXIT_SUCCESS;
}

// ============================================================================
// update
// ============================================================================

void UpdateCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Numeric snippet identifier")
        ->required()
        ->type_name("<id>");

    app.add_option("files", files_, "Files to upload (replaces all existing files)")
        ->type_name("<file>...");

    app.add_flag("-y,--yes", no_prompt_, "Do not prompt; keep the current metadata");
}

int UpdateCommand::execute(CommandContext& ctx) {
    auto id = parse_snippet_id(id_);
    if (!id) {
        std::cerr << "Error: Invalid snippet ID: " << id_ << "\n";
        return STASHY_EXIT_USER_ERROR;
    }
    if (files_.empty()) {
        std::cerr << "Error: Provide at least one file. "
                     "An update replaces every file of the snippet.\n";
        return STASHY_EXIT_USER_ERROR;
    }

    auto files = load_snippet_files(files_);
    if (!files.ok()) {
        return report_error(files.error());
    }

    // Current metadata seeds the prompts; the old files are dropped
    auto current = ctx.service->get(*id);
    if (!current.ok()) {
        return report_error(current.error());
    }

    SnippetDraft draft;
    draft.title = current->title;
    draft.description = current->description;
    draft.visibility = current->visibility;
    draft.categories = current->categories;
    draft.files = std::move(files.value());

    if (!no_prompt_) {
        std::cout << "Snippet " << *id << " currently has " << current->files.size()
                  << " file(s); they will be replaced by " << draft.files.size() << ".\n";
        auto prompted = prompt_draft(draft);
        if (!prompted) {
            std::cerr << "Cancelled.\n";
            return STASHY_EXIT_USER_ERROR;
        }
        draft = std::move(*prompted);
    }

    auto updated = ctx.service->update(*id, draft);
    if (!updated.ok()) {
        return report_error(updated.error());
    }

    print_saved("Updated", updated.value(), "");
    return STASHY_EXIT_SUCCESS;
}

}  // namespace stashy::cli
