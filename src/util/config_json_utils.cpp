#include "util/config_json_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <utility>

namespace selfupdate::config::detail {

namespace {

Result WrongType(const char* key, const char* expected) {
    return Result::Fail(EINVAL, std::string("config key ") + key + " must be " + expected);
}

Result ApplyString(const nlohmann::json& j, const char* key, std::string& out) {
    std::string v;
    switch (GetString(j, key, v)) {
        case FieldStatus::Absent:
            return Result::Ok();
        case FieldStatus::WrongType:
            return WrongType(key, "a string");
        case FieldStatus::Ok:
            break;
    }
    out = std::move(v);
    return Result::Ok();
}

Result ApplyBool(const nlohmann::json& j, const char* key, bool& out) {
    if (GetBool(j, key, out) == FieldStatus::WrongType) {
        return WrongType(key, "a boolean");
    }
    return Result::Ok();
}

} // namespace

FieldStatus GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return FieldStatus::Absent;
    if (!it->is_string())
        return FieldStatus::WrongType;
    out = it->get<std::string>();
    return FieldStatus::Ok;
}

FieldStatus GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return FieldStatus::Absent;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return FieldStatus::Ok;
    }
    if (!it->is_number_integer())
        return FieldStatus::WrongType;
    auto v = it->get<long long>();
    if (v < 0)
        return FieldStatus::WrongType;
    out = static_cast<std::uint64_t>(v);
    return FieldStatus::Ok;
}

FieldStatus GetBool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return FieldStatus::Absent;
    if (!it->is_boolean())
        return FieldStatus::WrongType;
    out = it->get<bool>();
    return FieldStatus::Ok;
}

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int err = errno;
        return Result::Fail(err, "cannot open " + path + " (" + std::strerror(err) + ")");
    }

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(EIO, "cannot open " + path);
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        return Result::Fail(EINVAL, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(EINVAL, "root must be JSON object: " + path);
    }

    return Result::Ok();
}

Result FillConfigFromJson(const nlohmann::json& j, UpdaterConfig& cfg) {
    const std::string previous_app = cfg.app_executable;
    const bool process_followed_app = cfg.process_name == cfg.app_executable;

    const std::pair<const char*, std::string*> string_fields[] = {
        {"StagingDir", &cfg.staging_dir},
        {"AppExecutable", &cfg.app_executable},
        {"ProcessName", &cfg.process_name},
        {"StagedDocument", &cfg.staged_document},
        {"TargetDocument", &cfg.target_document},
        {"TargetDir", &cfg.target_dir},
        {"ManifestFile", &cfg.manifest_file},
    };
    for (const auto& [key, field] : string_fields) {
        auto r = ApplyString(j, key, *field);
        if (!r.is_ok()) return r;
    }

    // The watched process is the executable being replaced unless named separately.
    if (process_followed_app && !j.contains("ProcessName") && cfg.app_executable != previous_app) {
        cfg.process_name = cfg.app_executable;
    }

    {
        std::uint64_t v{};
        const auto st = GetU64(j, "GraceDelayMs", v);
        if (st == FieldStatus::WrongType ||
            (st == FieldStatus::Ok &&
             v > static_cast<std::uint64_t>(std::chrono::milliseconds::max().count()))) {
            return WrongType("GraceDelayMs", "a non-negative integer");
        }
        if (st == FieldStatus::Ok) {
            cfg.grace_delay = std::chrono::milliseconds(v);
        }
    }
    {
        std::string policy;
        const auto st = GetString(j, "ErrorPolicy", policy);
        if (st == FieldStatus::WrongType) {
            return WrongType("ErrorPolicy", "a string");
        }
        if (st == FieldStatus::Ok && !ParseErrorPolicy(policy, cfg.error_policy)) {
            return Result::Fail(EINVAL, "unknown ErrorPolicy: " + policy +
                                            " (expected \"continue\" or \"fail-fast\")");
        }
    }

    if (auto r = ApplyBool(j, "VerifyIntegrity", cfg.verify_integrity); !r.is_ok()) return r;
    if (auto r = ApplyBool(j, "Verbose", cfg.verbose); !r.is_ok()) return r;

    return cfg.Validate();
}

} // namespace selfupdate::config::detail
