#include "search_command.hpp"
#include "list_command.hpp"

namespace stashy::cli {

void SearchCommand::setup(CLI::App& app) {
    app.add_option("query", query_, "Text to search for")
        ->required()
        ->type_name("<query>");

    app.add_option("-s,--sort", sort_, "Result order")
        ->type_name("<order>")
        ->check(CLI::IsMember({"newest", "oldest", "alpha-asc", "alpha-desc"}));

    app.add_flag("--search-code", search_code_, "Also search file contents");
}

int SearchCommand::execute(CommandContext& ctx) {
    auto order = parse_sort_order(sort_);
    if (!order) {
        std::cerr << "Error: Unknown sort order: " << sort_ << "\n";
        return STASHY_EXIT_USER_ERROR;
    }

    SearchQuery query;
    query.text = query_;
    query.sort = *order;
    query.search_code = search_code_;

    auto result = ctx.service->search(query);
    if (!result.ok()) {
        return report_error(result.error());
    }

    auto& snippets = result.value();
    if (snippets.empty()) {
        std::cout << "No snippets match '" << query_ << "'.\n";
        if (!search_code_) {
            std::cout << "Try --search-code to include file contents.\n";
        }
        return STASHY_EXIT_SUCCESS;
    }

    print_snippet_table(snippets);
    std::cout << "\n" << snippets.size() << " result(s), sorted " << sort_order_name(*order) << "\n";
    return STASHY_EXIT_SUCCESS;
}

}  // namespace stashy::cli
