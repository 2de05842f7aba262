#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>

namespace selfupdate {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    // Permission bits of the opened file (st_mode & 07777).
    mode_t Permissions() const { return perms_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    mode_t perms_ = 0644;
};

} // namespace selfupdate
