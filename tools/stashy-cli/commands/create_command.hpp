#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>
#include <vector>

namespace stashy::cli {

/**
 * Upload files as a new snippet.
 *
 * Metadata comes from options when given, otherwise from prompts.
 */
class CreateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "create"; }
    std::string description() const override {
        return "Create a new snippet";
    }

private:
    std::vector<std::string> files_;
    std::string title_;
    std::string desc_;
    std::string categories_;
    bool public_ = false;
    bool no_prompt_ = false;
};

/**
 * Replace a snippet's metadata and its whole file set.
 */
class UpdateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "update"; }
    std::string description() const override {
        return "Update an existing snippet (replaces all of its files)";
    }

private:
    std::string id_;
    std::vector<std::string> files_;
    bool no_prompt_ = false;
};

}  // namespace stashy::cli
