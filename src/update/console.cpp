#include "update/console.hpp"

#include <cerrno>
#include <termios.h>
#include <unistd.h>

namespace selfupdate {

namespace {

// Puts a terminal into non-canonical, no-echo mode and restores it on scope exit.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd) : fd_(fd) {
        if (!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0) return;
        termios raw = saved_;
        raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active_ = ::tcsetattr(fd_, TCSANOW, &raw) == 0;
    }
    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;
    ~RawModeGuard() {
        if (active_) ::tcsetattr(fd_, TCSANOW, &saved_);
    }

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

} // namespace

TerminalConsole::TerminalConsole(std::FILE* out, int in_fd) : out_(out), in_fd_(in_fd) {}

void TerminalConsole::ShowMessage(const std::string& text) {
    std::fprintf(out_, "%s\n", text.c_str());
    std::fflush(out_);
}

void TerminalConsole::WaitForAnyKey(const std::string& prompt) {
    std::fprintf(out_, "%s", prompt.c_str());
    std::fflush(out_);

    {
        RawModeGuard raw(in_fd_);
        char c = 0;
        ssize_t n;
        do {
            n = ::read(in_fd_, &c, 1);
        } while (n < 0 && errno == EINTR);
    }

    std::fprintf(out_, "\n");
    std::fflush(out_);
}

} // namespace selfupdate
