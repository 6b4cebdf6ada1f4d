#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace stashy::cli {

/**
 * Show a snippet, or write its files to a directory.
 */
class GetCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "get"; }
    std::string description() const override {
        return "Show a snippet and its files";
    }

private:
    std::string id_;
    bool raw_ = false;
    std::string output_dir_;
};

}  // namespace stashy::cli
