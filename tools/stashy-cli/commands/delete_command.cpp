#include "delete_command.hpp"
#include "../interactive/prompt.hpp"

namespace stashy::cli {

void DeleteCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Numeric snippet identifier")
        ->required()
        ->type_name("<id>");

    app.add_flag("-f,--force", force_, "Skip confirmation prompt");
}

int DeleteCommand::execute(CommandContext& ctx) {
    auto id = parse_snippet_id(id_);
    if (!id) {
        std::cerr << "Error: Invalid snippet ID: " << id_ << "\n";
        return STASHY_EXIT_USER_ERROR;
    }

    // Confirm deletion unless --force
    if (!force_) {
        auto snippet = ctx.service->get(*id);
        if (!snippet.ok()) {
            return report_error(snippet.error());
        }
        auto answer = confirm("Delete snippet " + std::to_string(*id) + " (" +
                              snippet->title + ")?", false);
        if (!answer || !*answer) {
            std::cout << "Cancelled.\n";
            return STASHY_EXIT_SUCCESS;
        }
    }

    auto result = ctx.service->remove(*id, force_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "Deleted snippet " << *id << "\n";
    return STASHY_EXIT_SUCCESS;
}

}  // namespace stashy::cli
