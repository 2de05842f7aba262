#pragma once

#include "util/updater_config.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace selfupdate::config::detail {

enum class FieldStatus {
    Absent,
    Ok,
    WrongType,
};

FieldStatus GetString(const nlohmann::json& j, const char* key, std::string& out);
FieldStatus GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out);
FieldStatus GetBool(const nlohmann::json& j, const char* key, bool& out);

// Fails with err == ENOENT when the file does not exist.
Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);
Result FillConfigFromJson(const nlohmann::json& j, UpdaterConfig& cfg);

} // namespace selfupdate::config::detail
