#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace arcnav::config {

void ArcnavConfigFromFile::Reset() {
    batch_size.reset();
    extract_subdir.reset();
    on_error.reset();
    max_retries.reset();
    validate_crc.reset();
    extensions.reset();
    preflight_margin_ratio.reset();
    preflight_headroom_bytes.reset();
    log_level.reset();
}

Result ArcnavConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    if (auto r = detail::LoadJsonObjectFromFile(path, json); !r.is_ok()) {
        r.msg = "config: " + r.msg;
        return r;
    }

    std::string err;

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorCode::ValidationError, "config: " + err + " in " + path);
    }

    LogDebug("loaded config %s", path.c_str());
    return Result::Ok();
}

} // namespace arcnav::config
