#pragma once

#include "extract/extraction_state.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arcnav::config {

constexpr const char* kDefaultConfigPath = "/etc/arcnav/arcnav.conf";

// Optional defaults for the command-line tool. Unset fields keep the
// built-in defaults; command-line flags override whatever is set here.
class ArcnavConfigFromFile {
public:
    std::optional<std::int64_t> batch_size;
    std::optional<std::string> extract_subdir;
    std::optional<ErrorPolicy> on_error;
    std::optional<int> max_retries;
    std::optional<bool> validate_crc;
    std::optional<std::vector<std::string>> extensions;
    std::optional<double> preflight_margin_ratio;
    std::optional<std::uint64_t> preflight_headroom_bytes;
    std::optional<LogLevel> log_level;

    Result LoadFile(const std::string &path);

    void Reset();
};

} // namespace arcnav::config
