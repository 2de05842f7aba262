// file_writer.cpp - Writer implementation for regular files.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace selfupdate {

Result FileWriter::Open(std::string path, mode_t mode, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open output: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = errno;
        return Result::Fail(err, "Write failed: " + path_ + " (" + std::strerror(err) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int err = errno;
        return Result::Fail(err, "fsync failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    const int fd = fd_.Release();
    if (fd >= 0 && ::close(fd) != 0) {
        const int err = errno;
        return Result::Fail(err, "close failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

} // namespace selfupdate
