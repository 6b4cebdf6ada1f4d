#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace stashy::cli {

/**
 * Show or change the persisted client settings.
 */
class ConfigCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "config"; }
    std::string description() const override {
        return "Show or change client settings";
    }

private:
    uint32_t page_size_ = 0;
    int timeout_seconds_ = 0;
};

}  // namespace stashy::cli
