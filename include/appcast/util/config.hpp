#pragma once

#include "appcast/util/logger.hpp"
#include "appcast/util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace appcast {

// Identity of the running application. Immutable once loaded.
struct AppIdentity {
    std::string app_name;
    std::string current_version;
    std::string feed_url;
    std::string public_key_path;
};

namespace config {

inline constexpr const char* kDefaultConfigPath = "/etc/appcast/appcast.json";

class UpdaterConfigFromFile {
public:
    AppIdentity identity;

    std::string temp_dir;
    std::string skipped_versions_path;
    std::string user_agent;

    std::optional<std::uint64_t> fetch_timeout_seconds;
    std::optional<std::uint64_t> connect_timeout_seconds;
    std::optional<LogLevel> log_level;

    Result LoadFile(const std::string& path);

    void Reset();
};

} // namespace config
} // namespace appcast
