#include "util/updater_config.hpp"

#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

#include <cerrno>

// Build-time defaults; CMake passes the configured values.
#ifndef SELFUPDATE_DEFAULT_APP_EXECUTABLE
#define SELFUPDATE_DEFAULT_APP_EXECUTABLE "PS2JPMod.exe"
#endif
#ifndef SELFUPDATE_DEFAULT_STAGING_DIR
#define SELFUPDATE_DEFAULT_STAGING_DIR "data"
#endif
#ifndef SELFUPDATE_DEFAULT_STAGED_DOCUMENT
#define SELFUPDATE_DEFAULT_STAGED_DOCUMENT "default.txt"
#endif
#ifndef SELFUPDATE_DEFAULT_TARGET_DOCUMENT
#define SELFUPDATE_DEFAULT_TARGET_DOCUMENT "はじめにお読みください.txt"
#endif
#ifndef SELFUPDATE_DEFAULT_MANIFEST_FILE
#define SELFUPDATE_DEFAULT_MANIFEST_FILE "data/update-manifest.json"
#endif
#ifndef SELFUPDATE_DEFAULT_GRACE_DELAY_MS
#define SELFUPDATE_DEFAULT_GRACE_DELAY_MS 3000
#endif

namespace selfupdate {

const char* ToString(ErrorPolicy policy) {
    switch (policy) {
        case ErrorPolicy::ContinueOnError: return "continue";
        case ErrorPolicy::FailFast:        return "fail-fast";
    }
    return "unknown";
}

bool ParseErrorPolicy(std::string_view text, ErrorPolicy& out) {
    if (EqualsIgnoreAsciiCase(text, "continue")) {
        out = ErrorPolicy::ContinueOnError;
        return true;
    }
    if (EqualsIgnoreAsciiCase(text, "fail-fast")) {
        out = ErrorPolicy::FailFast;
        return true;
    }
    return false;
}

UpdaterConfig UpdaterConfig::Defaults() {
    UpdaterConfig cfg;
    cfg.staging_dir = SELFUPDATE_DEFAULT_STAGING_DIR;
    cfg.app_executable = SELFUPDATE_DEFAULT_APP_EXECUTABLE;
    cfg.process_name = SELFUPDATE_DEFAULT_APP_EXECUTABLE;
    cfg.staged_document = SELFUPDATE_DEFAULT_STAGED_DOCUMENT;
    cfg.target_document = SELFUPDATE_DEFAULT_TARGET_DOCUMENT;
    cfg.target_dir = ".";
    cfg.manifest_file = SELFUPDATE_DEFAULT_MANIFEST_FILE;
    cfg.grace_delay = std::chrono::milliseconds(SELFUPDATE_DEFAULT_GRACE_DELAY_MS);
    return cfg;
}

Result UpdaterConfig::LoadFile(const std::string& path, UpdaterConfig& out) {
    nlohmann::json json;
    auto r = config::detail::LoadJsonObjectFromFile(path, json);
    if (!r.is_ok()) return r;

    UpdaterConfig merged = out;
    r = config::detail::FillConfigFromJson(json, merged);
    if (!r.is_ok()) {
        return Result::Fail(r.err, r.msg + " in " + path);
    }

    out = std::move(merged);
    return Result::Ok();
}

std::string UpdaterConfig::StagedExecutablePath() const {
    return JoinPath(staging_dir, app_executable);
}

std::string UpdaterConfig::StagedDocumentPath() const {
    return JoinPath(staging_dir, staged_document);
}

std::string UpdaterConfig::TargetExecutablePath() const {
    return JoinPath(target_dir, app_executable);
}

std::string UpdaterConfig::TargetDocumentPath() const {
    return JoinPath(target_dir, target_document);
}

Result UpdaterConfig::Validate() const {
    if (app_executable.empty()) {
        return Result::Fail(EINVAL, "AppExecutable must not be empty");
    }
    if (process_name.empty()) {
        return Result::Fail(EINVAL, "ProcessName must not be empty");
    }
    if (staged_document.empty() || target_document.empty()) {
        return Result::Fail(EINVAL, "StagedDocument/TargetDocument must not be empty");
    }
    if (ImageBaseName(app_executable) != app_executable) {
        return Result::Fail(EINVAL, "AppExecutable must be a file name: " + app_executable);
    }
    if (StagedExecutablePath() == TargetExecutablePath() ||
        StagedDocumentPath() == TargetDocumentPath()) {
        return Result::Fail(EINVAL, "staging and target paths must differ");
    }
    return Result::Ok();
}

} // namespace selfupdate
