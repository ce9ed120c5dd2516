#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace splitpack::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, ToolConfigFromFile& cfg, std::string& err);

} // namespace splitpack::config::detail
