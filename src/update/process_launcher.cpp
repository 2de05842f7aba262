#include "update/process_launcher.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace selfupdate {

namespace {

[[noreturn]] void ReportAndExit(int report_fd, int err) {
    ssize_t rc;
    do {
        rc = ::write(report_fd, &err, sizeof(err));
    } while (rc < 0 && errno == EINTR);
    ::_exit(127);
}

} // namespace

Result PosixProcessLauncher::LaunchDetached(const std::string& executable,
                                            const std::string& working_dir) const {
    std::error_code ec;
    const std::string exe_abs = fs::absolute(executable, ec).string();
    if (ec) {
        return Result::Fail(ec.value(), "cannot resolve " + executable + ": " + ec.message());
    }
    const std::string cwd = working_dir.empty() ? std::string(".") : working_dir;

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int err = errno;
        return Result::Fail(err, "pipe2 failed (" + std::string(std::strerror(err)) + ")");
    }
    Fd read_end(fds[0]);
    Fd write_end(fds[1]);

    // Everything the children touch is prepared before fork().
    char* const argv[] = {const_cast<char*>(exe_abs.c_str()), nullptr};

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        return Result::Fail(err, "fork failed (" + std::string(std::strerror(err)) + ")");
    }

    if (pid == 0) {
        const int report_fd = write_end.Get();
        ::setsid();
        const pid_t grandchild = ::fork();
        if (grandchild < 0) ReportAndExit(report_fd, errno);
        if (grandchild > 0) ::_exit(0);

        if (::chdir(cwd.c_str()) != 0) ReportAndExit(report_fd, errno);
        ::execv(exe_abs.c_str(), argv);
        ReportAndExit(report_fd, errno);
    }

    write_end.Close();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            const int err = errno;
            return Result::Fail(err, "waitpid failed (" + std::string(std::strerror(err)) + ")");
        }
    }

    int child_err = 0;
    ssize_t n;
    do {
        n = ::read(read_end.Get(), &child_err, sizeof(child_err));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_err))) {
        return Result::Fail(child_err, "launch failed: " + exe_abs + " (" + std::strerror(child_err) + ")");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return Result::Fail(-1, "launch helper exited with status " + std::to_string(WEXITSTATUS(status)));
    }

    LogInfo("Launched %s (cwd=%s)", exe_abs.c_str(), cwd.c_str());
    return Result::Ok();
}

} // namespace selfupdate
