#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace stashy::cli {

/**
 * Search snippets by title and description, optionally by file contents.
 */
class SearchCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "search"; }
    std::string description() const override {
        return "Search snippets";
    }

private:
    std::string query_;
    std::string sort_ = "newest";
    bool search_code_ = false;
};

}  // namespace stashy::cli
