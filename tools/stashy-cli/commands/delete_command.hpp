#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace stashy::cli {

/**
 * Delete a snippet from the server.
 */
class DeleteCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "delete"; }
    std::string description() const override {
        return "Delete a snippet";
    }

private:
    std::string id_;
    bool force_ = false;
};

}  // namespace stashy::cli
