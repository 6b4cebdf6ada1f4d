#include "list_command.hpp"
#include <iomanip>

namespace stashy::cli {

void print_snippet_table(const std::vector<Snippet>& snippets) {
    std::cout << std::left
              << std::setw(8) << "ID"
              << std::setw(30) << "TITLE"
              << std::setw(10) << "VIS"
              << std::setw(24) << "CATEGORIES"
              << "UPDATED\n";
    std::cout << std::string(88, '-') << "\n";

    for (const auto& s : snippets) {
        std::cout << std::left
                  << std::setw(8) << s.id
                  << std::setw(30) << truncate(s.title, 29)
                  << std::setw(10) << visibility_name(s.visibility)
                  << std::setw(24) << truncate(join_categories(s.categories), 23)
                  << format_timestamp(s.updated_at) << "\n";
    }
}

void ListCommand::setup(CLI::App& app) {
    app.add_flag("-a,--all", all_, "Fetch every page");

    app.add_option("-n,--number", page_size_, "Snippets per page (default from config)")
        ->type_name("<num>")
        ->check(CLI::PositiveNumber);

    app.add_option("-p,--page", page_, "Page to show, starting at 1")
        ->type_name("<page>")
        ->check(CLI::PositiveNumber);
}

int ListCommand::execute(CommandContext& ctx) {
    uint32_t page_size = page_size_ != 0 ? page_size_
                                         : ctx.session->config().default_page_size;

    if (all_) {
        auto result = ctx.service->list(1, page_size, true);
        if (!result.ok()) {
            return report_error(result.error());
        }
        auto& snippets = result.value();
        if (snippets.empty()) {
            std::cout << "No snippets found.\n";
            std::cout << "Use 'stashy create' to upload your first snippet.\n";
            return STASHY_EXIT_SUCCESS;
        }
        print_snippet_table(snippets);
        std::cout << "\n" << snippets.size() << " snippet(s)\n";
        return STASHY_EXIT_SUCCESS;
    }

    auto result = ctx.service->list_page(page_, page_size);
    if (!result.ok()) {
        return report_error(result.error());
    }

    const Page& page = result.value();
    if (page.items.empty()) {
        if (page_ == 1) {
            std::cout << "No snippets found.\n";
            std::cout << "Use 'stashy create' to upload your first snippet.\n";
        } else {
            std::cout << "Page " << page_ << " is empty (" << page.total << " snippet(s) in total).\n";
        }
        return STASHY_EXIT_SUCCESS;
    }

    print_snippet_table(page.items);

    uint64_t pages = page.page_size == 0 ? 1 : (page.total + page.page_size - 1) / page.page_size;
    std::cout << "\nPage " << page.page_number << " of " << pages
              << " (" << page.total << " snippet(s))\n";
    if (page.page_number < pages) {
        std::cout << "Next: stashy list -p " << page.page_number + 1 << "\n";
    }
    return STASHY_EXIT_SUCCESS;
}

}  // namespace stashy::cli
