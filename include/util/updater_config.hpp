#pragma once

#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace selfupdate {

enum class ErrorPolicy {
    ContinueOnError,
    FailFast,
};

const char* ToString(ErrorPolicy policy);
bool ParseErrorPolicy(std::string_view text, ErrorPolicy& out);

// Paths are relative to the working directory unless absolute.
struct UpdaterConfig {
    std::string staging_dir;
    std::string app_executable;
    std::string process_name;
    std::string staged_document;
    std::string target_document;
    std::string target_dir;
    std::string manifest_file;

    std::chrono::milliseconds grace_delay{0};
    ErrorPolicy error_policy = ErrorPolicy::ContinueOnError;
    bool verify_integrity = true;
    bool verbose = false;

    // Built from the values compiled into the launcher.
    static UpdaterConfig Defaults();

    // Applies overrides from a JSON config file on top of `out`.
    // A missing file fails with err == ENOENT so callers can treat it as optional.
    static Result LoadFile(const std::string& path, UpdaterConfig& out);

    std::string StagedExecutablePath() const;
    std::string StagedDocumentPath() const;
    std::string TargetExecutablePath() const;
    std::string TargetDocumentPath() const;

    Result Validate() const;
};

} // namespace selfupdate
