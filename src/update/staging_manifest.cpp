#include "update/staging_manifest.hpp"

#include "crypto/sha256.hpp"
#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

#include <cctype>
#include <cerrno>
#include <nlohmann/json.hpp>

namespace selfupdate {

namespace {

bool IsHexDigest(const std::string& s) {
    if (s.size() != 64) return false;
    for (unsigned char c : s) {
        if (!std::isxdigit(c)) return false;
    }
    return true;
}

Result FillFromJson(const nlohmann::json& j, StagingManifest& out) {
    using config::detail::FieldStatus;

    if (config::detail::GetString(j, "version", out.version) == FieldStatus::WrongType) {
        return Result::Fail(EINVAL, "manifest version must be a string");
    }

    auto it = j.find("files");
    if (it == j.end() || !it->is_array()) {
        return Result::Fail(EINVAL, "manifest missing files array");
    }

    for (const auto& item : *it) {
        if (!item.is_object()) {
            return Result::Fail(EINVAL, "manifest files entries must be objects");
        }
        StagedFile f;
        if (config::detail::GetString(item, "name", f.name) != FieldStatus::Ok || f.name.empty()) {
            return Result::Fail(EINVAL, "manifest file entry missing name");
        }
        if (ImageBaseName(f.name) != f.name) {
            return Result::Fail(EINVAL, "manifest file name must not contain a path: " + f.name);
        }
        if (config::detail::GetString(item, "sha256", f.sha256) != FieldStatus::Ok ||
            !IsHexDigest(f.sha256)) {
            return Result::Fail(EINVAL, "manifest file entry has invalid sha256: " + f.name);
        }
        out.files.push_back(std::move(f));
    }
    return Result::Ok();
}

} // namespace

Result StagingManifest::Parse(const std::string& json_text, StagingManifest& out) {
    out = StagingManifest{};

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const std::exception& e) {
        return Result::Fail(EINVAL, std::string("invalid manifest JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return Result::Fail(EINVAL, "manifest root must be JSON object");
    }
    return FillFromJson(j, out);
}

Result StagingManifest::LoadFromFile(const std::string& path, StagingManifest& out) {
    out = StagingManifest{};

    nlohmann::json j;
    auto r = config::detail::LoadJsonObjectFromFile(path, j);
    if (!r.is_ok()) return r;

    r = FillFromJson(j, out);
    if (!r.is_ok()) return Result::Fail(r.err, r.msg + " in " + path);
    return Result::Ok();
}

std::optional<std::string> StagingManifest::ExpectedSha256(const std::string& name) const {
    for (const auto& f : files) {
        if (f.name == name) return f.sha256;
    }
    return std::nullopt;
}

Result StagingManifest::VerifyFile(const std::string& path, const std::string& expected_sha256) {
    if (expected_sha256.empty())
        return Result::Fail(-1, "expected sha256 is empty");

    std::string actual;
    auto r = Sha256HexFile(path, actual);
    if (!r.is_ok()) return r;

    if (!Sha256HexEquals(actual, expected_sha256)) {
        return Result::Fail(-1, "sha256 mismatch for " + path + ": expected=" + expected_sha256 +
                                    " actual=" + actual);
    }
    return Result::Ok();
}

} // namespace selfupdate
