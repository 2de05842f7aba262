#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace selfupdate {

// Truncating writer for a regular file. Created with `mode` when absent.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, mode_t mode, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

  private:
    std::string path_;
    Fd fd_;
};

} // namespace selfupdate
