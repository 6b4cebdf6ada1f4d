#include "get_command.hpp"

#include <stashy/snippet_draft.hpp>

namespace stashy::cli {

namespace {

int write_files(const Snippet& snippet, const std::filesystem::path& dir) {
    auto written = write_snippet_files(snippet, dir);
    if (!written.ok()) {
        return report_error(written.error());
    }
    for (size_t i = 0; i < written->size(); ++i) {
        std::cout << "Wrote " << (*written)[i].string() << " ("
                  << snippet.files[i].content.size() << " bytes)\n";
    }
    return STASHY_EXIT_SUCCESS;
}

}  // namespace

void GetCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Numeric snippet identifier")
        ->required()
        ->type_name("<id>");

    app.add_flag("--raw", raw_, "Output file contents only, no headers");

    app.add_option("-o,--output-dir", output_dir_, "Write the files into this directory")
        ->type_name("<dir>");
}

int GetCommand::execute(CommandContext& ctx) {
    auto id = parse_snippet_id(id_);
    if (!id) {
        std::cerr << "Error: Invalid snippet ID: " << id_ << "\n";
        return STASHY_EXIT_USER_ERROR;
    }

    auto result = ctx.service->get(*id);
    if (!result.ok()) {
        return report_error(result.error());
    }
    const Snippet& snippet = result.value();

    if (!output_dir_.empty()) {
        return write_files(snippet, output_dir_);
    }

    if (raw_) {
        for (const auto& file : snippet.files) {
            std::cout << file.content;
        }
        return STASHY_EXIT_SUCCESS;
    }

    std::cout << "# " << snippet.title << " (#" << snippet.id << ", "
              << visibility_name(snippet.visibility) << ")\n";
    if (!snippet.description.empty()) {
        std::cout << "# " << snippet.description << "\n";
    }
    if (!snippet.categories.empty()) {
        std::cout << "# Categories: " << join_categories(snippet.categories) << "\n";
    }
    std::cout << "# Updated: " << format_timestamp(snippet.updated_at);
    if (snippet.share_count > 0) {
        std::cout << "  Shared: " << snippet.share_count;
    }
    std::cout << "\n";

    for (const auto& file : snippet.files) {
        std::cout << "\n== " << file.filename;
        if (file.language) {
            std::cout << " [" << *file.language << "]";
        }
        std::cout << " ==\n" << file.content;

        // Ensure trailing newline
        if (!file.content.empty() && file.content.back() != '\n') {
            std::cout << "\n";
        }
    }

    return STASHY_EXIT_SUCCESS;
}

}  // namespace stashy::cli
