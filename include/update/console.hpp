#pragma once

#include <cstdio>
#include <string>

namespace selfupdate {

class IConsole {
public:
    virtual ~IConsole() = default;
    virtual void ShowMessage(const std::string& text) = 0;
    // Blocks until the user presses a key (or input reaches EOF).
    virtual void WaitForAnyKey(const std::string& prompt) = 0;
};

class TerminalConsole final : public IConsole {
public:
    explicit TerminalConsole(std::FILE* out = stdout, int in_fd = 0);

    void ShowMessage(const std::string& text) override;
    void WaitForAnyKey(const std::string& prompt) override;

private:
    std::FILE* out_;
    int in_fd_;
};

} // namespace selfupdate
