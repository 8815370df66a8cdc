#pragma once

#include "appcast/util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace appcast::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, UpdaterConfigFromFile& cfg, std::string& err);

} // namespace appcast::config::detail
