#include "extract/extraction_state.hpp"

#include "io/file_writer.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

namespace arcnav {

using json = nlohmann::json;

namespace {

// Key names are shared with other implementations of the same state format.
constexpr const char* kArchive = "zip_path";
constexpr const char* kBase = "base_at_init";
constexpr const char* kOrder = "order";
constexpr const char* kCursor = "cursor";
constexpr const char* kBatchSize = "batch_size";
constexpr const char* kExtractDir = "extract_dir";
constexpr const char* kSeed = "seed";
constexpr const char* kExtensions = "extensions";
constexpr const char* kFailed = "failed";
constexpr const char* kOnError = "on_error";
constexpr const char* kMaxRetries = "max_retries";
constexpr const char* kValidateCrc = "validate_crc";

std::expected<std::string, std::string> RequireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::unexpected(std::string("missing '") + key + "'");
    if (!it->is_string()) return std::unexpected(std::string("'") + key + "' must be a string");
    return it->get<std::string>();
}

std::expected<std::uint64_t, std::string> RequireU64(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::unexpected(std::string("missing '") + key + "'");
    if (it->is_number_unsigned()) return it->get<std::uint64_t>();
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(it->get<std::int64_t>());
    }
    return std::unexpected(std::string("'") + key + "' must be a non-negative integer");
}

std::expected<std::vector<std::string>, std::string> StringArray(const json& j,
                                                                 const char* key,
                                                                 bool required) {
    auto it = j.find(key);
    if (it == j.end() || (!required && it->is_null())) {
        if (required) return std::unexpected(std::string("missing '") + key + "'");
        return std::vector<std::string>{};
    }
    if (!it->is_array()) return std::unexpected(std::string("'") + key + "' must be an array");

    std::vector<std::string> out;
    out.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return std::unexpected(std::string("'") + key + "' must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

Result ParseErrorPolicy(std::string_view text, ErrorPolicy& out) {
    if (text == "skip") {
        out = ErrorPolicy::Skip;
    } else if (text == "abort") {
        out = ErrorPolicy::Abort;
    } else {
        return Result::Fail(ErrorCode::ValidationError,
                            "on_error must be 'skip' or 'abort', got '" + std::string(text) + "'");
    }
    return Result::Ok();
}

const char* ErrorPolicyName(ErrorPolicy policy) {
    return policy == ErrorPolicy::Abort ? "abort" : "skip";
}

std::vector<std::string> NormalizeExtensions(const std::optional<std::vector<std::string>>& exts) {
    if (!exts) return {};

    std::set<std::string> norm;
    for (const auto& raw : *exts) {
        const auto first = raw.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) continue;
        const auto last = raw.find_last_not_of(" \t\r\n");

        std::string e = raw.substr(first, last - first + 1);
        std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (e.front() != '.') e.insert(e.begin(), '.');
        norm.insert(std::move(e));
    }
    return {norm.begin(), norm.end()};
}

std::string ExtractionStateStore::Serialize(const ExtractionState& s) {
    json j = json::object();
    j[kArchive] = s.archive_identity;
    j[kBase] = s.base_directory;
    j[kOrder] = s.order;
    j[kCursor] = s.cursor;
    j[kBatchSize] = s.batch_size;
    j[kExtractDir] = s.extract_dir;
    j[kSeed] = s.seed;
    j[kExtensions] = s.extensions;
    j[kFailed] = s.failed;
    j[kOnError] = ErrorPolicyName(s.on_error);
    j[kMaxRetries] = s.max_retries;
    j[kValidateCrc] = s.validate_crc;
    return j.dump(2) + "\n";
}

std::expected<ExtractionState, std::string> ExtractionStateStore::Parse(const std::string& json_input) {
    json j;
    try {
        j = json::parse(json_input);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) return std::unexpected("state root must be a JSON object");

    ExtractionState s;

    auto archive = RequireString(j, kArchive);
    if (!archive) return std::unexpected(archive.error());
    s.archive_identity = std::move(*archive);

    auto base = RequireString(j, kBase);
    if (!base) return std::unexpected(base.error());
    s.base_directory = std::move(*base);

    auto order = StringArray(j, kOrder, /*required=*/true);
    if (!order) return std::unexpected(order.error());
    s.order = std::move(*order);

    auto cursor = RequireU64(j, kCursor);
    if (!cursor) return std::unexpected(cursor.error());
    if (*cursor > s.order.size()) return std::unexpected("'cursor' is past the end of 'order'");
    s.cursor = static_cast<std::size_t>(*cursor);

    auto batch = RequireU64(j, kBatchSize);
    if (!batch) return std::unexpected(batch.error());
    if (*batch == 0) return std::unexpected("'batch_size' must be > 0");
    s.batch_size = static_cast<std::size_t>(*batch);

    auto seed = RequireU64(j, kSeed);
    if (!seed) return std::unexpected(seed.error());
    s.seed = *seed;

    auto exts = StringArray(j, kExtensions, /*required=*/false);
    if (!exts) return std::unexpected(exts.error());
    s.extensions = NormalizeExtensions(*exts);

    auto failed = StringArray(j, kFailed, /*required=*/false);
    if (!failed) return std::unexpected(failed.error());
    for (auto& f : *failed) {
        if (std::find(s.failed.begin(), s.failed.end(), f) == s.failed.end()) {
            s.failed.push_back(std::move(f));
        }
    }

    if (auto it = j.find(kExtractDir); it != j.end() && it->is_string()) {
        s.extract_dir = it->get<std::string>();
    }

    if (auto it = j.find(kOnError); it != j.end()) {
        if (!it->is_string()) return std::unexpected("'on_error' must be a string");
        if (auto r = ParseErrorPolicy(it->get<std::string>(), s.on_error); !r.is_ok()) {
            return std::unexpected(r.msg);
        }
    }

    if (j.contains(kMaxRetries)) {
        auto retries = RequireU64(j, kMaxRetries);
        if (!retries) return std::unexpected(retries.error());
        if (*retries > static_cast<std::uint64_t>(kMaxRetriesLimit)) {
            return std::unexpected("'max_retries' must be <= " + std::to_string(kMaxRetriesLimit));
        }
        s.max_retries = static_cast<int>(*retries);
    }

    if (auto it = j.find(kValidateCrc); it != j.end()) {
        if (!it->is_boolean()) return std::unexpected("'validate_crc' must be a boolean");
        s.validate_crc = it->get<bool>();
    }

    return s;
}

Result ExtractionStateStore::Load(const std::string& path, ExtractionState& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorCode::NotFound, "No saved iterator state found: " + path);
    }

    std::stringstream ss;
    ss << is.rdbuf();

    auto parsed = Parse(ss.str());
    if (!parsed) {
        return Result::Fail(ErrorCode::StateConflict,
                            "Corrupt iterator state " + path + ": " + parsed.error());
    }
    out = std::move(*parsed);
    return Result::Ok();
}

Result ExtractionStateStore::Save(const std::string& path, const ExtractionState& state) {
    return WriteFileAtomically(path, Serialize(state));
}

} // namespace arcnav
