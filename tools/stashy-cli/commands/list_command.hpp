#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace stashy::cli {

/**
 * List snippets on the server, one page or all of them.
 */
class ListCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "list"; }
    std::string description() const override {
        return "List your snippets";
    }

private:
    bool all_ = false;
    uint32_t page_size_ = 0;
    uint32_t page_ = 1;
};

// Print snippets as a table, shared with search
void print_snippet_table(const std::vector<Snippet>& snippets);

}  // namespace stashy::cli
