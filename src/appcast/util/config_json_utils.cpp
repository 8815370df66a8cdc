#include "appcast/util/config_json_utils.hpp"

#include "appcast/util/version.hpp"

#include <fstream>

namespace appcast::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned())
        return false;
    out = it->get<std::uint64_t>();
    return true;
}

bool IsWrongType(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && !it->is_string();
}

// Negative numbers parse as number_integer and fractions as number_float.
bool IsNotUnsigned(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && !it->is_number_unsigned();
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpdaterConfigFromFile& cfg, std::string& err) {
    for (const char* key : {"app_name", "current_version", "feed_url", "public_key_path",
                            "temp_dir", "skipped_versions_path", "user_agent", "log_level"}) {
        if (IsWrongType(j, key)) {
            err = std::string("'") + key + "' must be a string";
            return false;
        }
    }
    for (const char* key : {"fetch_timeout_seconds", "connect_timeout_seconds"}) {
        if (IsNotUnsigned(j, key)) {
            err = std::string("'") + key + "' must be a non-negative integer";
            return false;
        }
    }

    GetStringIfPresent(j, "app_name", cfg.identity.app_name);
    GetStringIfPresent(j, "current_version", cfg.identity.current_version);
    GetStringIfPresent(j, "feed_url", cfg.identity.feed_url);
    GetStringIfPresent(j, "public_key_path", cfg.identity.public_key_path);
    GetStringIfPresent(j, "temp_dir", cfg.temp_dir);
    GetStringIfPresent(j, "skipped_versions_path", cfg.skipped_versions_path);
    GetStringIfPresent(j, "user_agent", cfg.user_agent);

    if (cfg.identity.current_version.empty()) {
        err = "missing current_version";
        return false;
    }
    if (auto v = Version::Parse(cfg.identity.current_version); !v) {
        err = "invalid current_version: " + v.error();
        return false;
    }
    if (cfg.identity.feed_url.empty()) {
        err = "missing feed_url";
        return false;
    }

    {
        std::uint64_t v{};
        if (GetU64IfPresent(j, "fetch_timeout_seconds", v)) {
            cfg.fetch_timeout_seconds = v;
        }
        if (GetU64IfPresent(j, "connect_timeout_seconds", v)) {
            cfg.connect_timeout_seconds = v;
        }
    }
    {
        std::string level;
        if (GetStringIfPresent(j, "log_level", level)) {
            cfg.log_level = ParseLogLevel(level);
            if (!cfg.log_level) {
                err = "unknown log_level '" + level + "'";
                return false;
            }
        }
    }

    return true;
}

} // namespace appcast::config::detail
