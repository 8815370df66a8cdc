#include "appcast/util/config.hpp"

#include "appcast/util/config_json_utils.hpp"
#include "appcast/util/errors.hpp"

namespace appcast::config {

void UpdaterConfigFromFile::Reset() {
    identity = AppIdentity{};
    temp_dir.clear();
    skipped_versions_path.clear();
    user_agent.clear();
    fetch_timeout_seconds.reset();
    connect_timeout_seconds.reset();
    log_level.reset();
}

Result UpdaterConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(errc::kConfig, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(errc::kConfig, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace appcast::config
