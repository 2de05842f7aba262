#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace selfupdate {

struct ReplaceReport {
    std::uint64_t bytes = 0;
    // Digest of the bytes written to the target.
    std::string sha256;
};

class FileReplacer {
public:
    // Copies `source` over `target` through "<target>.tmp" + rename(2), so a reader of
    // `target` sees either the old or the new content. The permission bits of
    // `source` are applied to the result.
    static Result Replace(const std::string& source, const std::string& target, ReplaceReport& out);

    // ENOENT counts as success.
    static Result RemoveIfExists(const std::string& path);
};

} // namespace selfupdate
