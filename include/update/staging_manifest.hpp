#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace selfupdate {

struct StagedFile {
    std::string name;
    std::string sha256;
};

// Expected hashes for the files in the staging directory, e.g.
//   {"version": "1.2.0", "files": [{"name": "App.exe", "sha256": "..."}]}
struct StagingManifest {
    std::string version;
    std::vector<StagedFile> files;

    static Result Parse(const std::string& json_text, StagingManifest& out);
    // A missing file fails with err == ENOENT.
    static Result LoadFromFile(const std::string& path, StagingManifest& out);

    std::optional<std::string> ExpectedSha256(const std::string& name) const;

    static Result VerifyFile(const std::string& path, const std::string& expected_sha256);
};

} // namespace selfupdate
