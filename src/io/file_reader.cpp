#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace selfupdate {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open input: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        out.fd_.Close();
        return Result::Fail(err, "fstat failed: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        out.fd_.Close();
        return Result::Fail(EINVAL, "Not a regular file: " + out.path_);
    }

    out.size_ = static_cast<std::uint64_t>(st.st_size);
    out.perms_ = st.st_mode & 07777;
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace selfupdate
