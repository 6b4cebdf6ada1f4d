#include "prompt.hpp"

#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace stashy::cli {

namespace {

// Restores the terminal's echo flag on scope exit
class EchoGuard {
public:
    EchoGuard() {
        if (tcgetattr(STDIN_FILENO, &original_) == 0) {
            struct termios silent = original_;
            silent.c_lflag &= ~ECHO;
            active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
        }
    }
    ~EchoGuard() {
        if (active_) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
        }
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    struct termios original_{};
    bool active_ = false;
};

}  // namespace

bool stdin_is_terminal() {
    return isatty(STDIN_FILENO);
}

std::optional<std::string> prompt_line(const std::string& label,
                                       const std::string& default_value) {
    std::cout << label;
    if (!default_value.empty()) {
        std::cout << " [" << default_value << "]";
    }
    std::cout << ": " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    if (line.empty()) {
        return default_value;
    }
    return line;
}

std::optional<std::string> prompt_secret(const std::string& label) {
    std::cout << label << ": " << std::flush;

    std::string line;
    bool read_ok;
    if (stdin_is_terminal()) {
        EchoGuard guard;
        read_ok = static_cast<bool>(std::getline(std::cin, line));
        std::cout << "\n";
    } else {
        read_ok = static_cast<bool>(std::getline(std::cin, line));
    }
    if (!read_ok) {
        return std::nullopt;
    }
    return line;
}

std::optional<bool> confirm(const std::string& label, bool default_value) {
    std::cout << label << (default_value ? " [Y/n]: " : " [y/N]: ") << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    if (line.empty()) {
        return default_value;
    }
    return line == "y" || line == "Y" || line == "yes";
}

}  // namespace stashy::cli
