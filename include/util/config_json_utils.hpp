#pragma once

#include "util/config_parser.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace arcnav::config::detail {

// NotFound only when the file cannot be opened; a parse error or a
// non-object root is a ValidationError.
Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);
bool FillConfigFromJson(const nlohmann::json& j, ArcnavConfigFromFile& cfg, std::string& err);

} // namespace arcnav::config::detail
