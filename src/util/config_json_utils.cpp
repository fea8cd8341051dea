#include "util/config_json_utils.hpp"

#include "extract/extraction_state.hpp"

#include <cerrno>
#include <fstream>

namespace arcnav::config::detail {

namespace {

// Each getter returns false when the key is absent and sets `bad` when the
// key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, bool& bad) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string()) {
        bad = true;
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetI64IfPresent(const nlohmann::json& j, const char* key, std::int64_t& out, bool& bad) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_number_integer()) {
        bad = true;
        return false;
    }
    out = it->get<std::int64_t>();
    return true;
}

bool GetDoubleIfPresent(const nlohmann::json& j, const char* key, double& out, bool& bad) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_number()) {
        bad = true;
        return false;
    }
    out = it->get<double>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, bool& bad) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean()) {
        bad = true;
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool TypeError(std::string& err, const char* key, const char* want) {
    err = std::string(key) + " must be " + want;
    return false;
}

} // namespace

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorCode::NotFound, errno, "cannot open " + path);
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorCode::ValidationError, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(ErrorCode::ValidationError, "root must be JSON object: " + path);
    }

    return Result::Ok();
}

bool FillConfigFromJson(const nlohmann::json& j, ArcnavConfigFromFile& cfg, std::string& err) {
    bool bad = false;

    {
        std::int64_t v{};
        if (GetI64IfPresent(j, "BatchSize", v, bad)) {
            if (v <= 0) {
                err = "BatchSize must be > 0";
                return false;
            }
            cfg.batch_size = v;
        }
        if (bad)
            return TypeError(err, "BatchSize", "an integer");
    }
    {
        std::string s;
        if (GetStringIfPresent(j, "ExtractSubdir", s, bad)) {
            if (s.empty()) {
                err = "ExtractSubdir must not be empty";
                return false;
            }
            cfg.extract_subdir = s;
        }
        if (bad)
            return TypeError(err, "ExtractSubdir", "a string");
    }
    {
        std::string s;
        if (GetStringIfPresent(j, "OnError", s, bad)) {
            ErrorPolicy p{};
            if (auto r = ParseErrorPolicy(s, p); !r.is_ok()) {
                err = r.msg;
                return false;
            }
            cfg.on_error = p;
        }
        if (bad)
            return TypeError(err, "OnError", "a string");
    }
    {
        std::int64_t v{};
        if (GetI64IfPresent(j, "MaxRetries", v, bad)) {
            if (v < 0 || v > kMaxRetriesLimit) {
                err = "MaxRetries must be in [0, " + std::to_string(kMaxRetriesLimit) + "]";
                return false;
            }
            cfg.max_retries = static_cast<int>(v);
        }
        if (bad)
            return TypeError(err, "MaxRetries", "an integer");
    }
    {
        bool b{};
        if (GetBoolIfPresent(j, "ValidateCrc", b, bad)) {
            cfg.validate_crc = b;
        }
        if (bad)
            return TypeError(err, "ValidateCrc", "a boolean");
    }
    if (auto it = j.find("Extensions"); it != j.end()) {
        if (!it->is_array())
            return TypeError(err, "Extensions", "an array of strings");
        std::vector<std::string> exts;
        for (const auto& e : *it) {
            if (!e.is_string())
                return TypeError(err, "Extensions", "an array of strings");
            exts.push_back(e.get<std::string>());
        }
        cfg.extensions = std::move(exts);
    }
    {
        double v{};
        if (GetDoubleIfPresent(j, "PreflightMarginRatio", v, bad)) {
            if (v < 0.0) {
                err = "PreflightMarginRatio must be >= 0";
                return false;
            }
            cfg.preflight_margin_ratio = v;
        }
        if (bad)
            return TypeError(err, "PreflightMarginRatio", "a number");
    }
    {
        std::int64_t v{};
        if (GetI64IfPresent(j, "PreflightHeadroomBytes", v, bad)) {
            if (v < 0) {
                err = "PreflightHeadroomBytes must be >= 0";
                return false;
            }
            cfg.preflight_headroom_bytes = static_cast<std::uint64_t>(v);
        }
        if (bad)
            return TypeError(err, "PreflightHeadroomBytes", "an integer");
    }
    {
        std::string s;
        if (GetStringIfPresent(j, "LogLevel", s, bad)) {
            LogLevel lvl{};
            if (!ParseLogLevel(s, lvl)) {
                err = "unknown LogLevel '" + s + "'";
                return false;
            }
            cfg.log_level = lvl;
        }
        if (bad)
            return TypeError(err, "LogLevel", "a string");
    }

    return true;
}

} // namespace arcnav::config::detail
