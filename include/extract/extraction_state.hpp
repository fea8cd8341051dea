#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arcnav {

enum class ErrorPolicy { Skip, Abort };

// "skip" | "abort"; anything else is a ValidationError.
Result ParseErrorPolicy(std::string_view text, ErrorPolicy& out);
const char* ErrorPolicyName(ErrorPolicy policy);

// Lowercases, strips blanks, prefixes '.', sorts and de-duplicates.
// An absent or effectively empty list means "no filter" (empty result).
std::vector<std::string> NormalizeExtensions(const std::optional<std::vector<std::string>>& exts);

// Upper bound for max_retries wherever it is accepted.
inline constexpr int kMaxRetriesLimit = 1000;

// Everything needed to continue an extraction run in another process.
struct ExtractionState {
    std::string archive_identity;
    std::string base_directory;
    std::vector<std::string> order;
    std::size_t cursor = 0;
    std::size_t batch_size = 0;
    std::uint64_t seed = 0;
    std::vector<std::string> extensions;
    std::vector<std::string> failed;
    ErrorPolicy on_error = ErrorPolicy::Skip;
    int max_retries = 1;
    bool validate_crc = false;
    std::string extract_dir;
};

class ExtractionStateStore {
  public:
    static constexpr const char* kFileName = ".arcnav_state.json";

    static std::string Serialize(const ExtractionState& state);
    static std::expected<ExtractionState, std::string> Parse(const std::string& json_input);

    // NotFound when the file is absent, StateConflict when it is malformed.
    static Result Load(const std::string& path, ExtractionState& out);
    // Atomic: a concurrent reader sees the old or the new file, never a mix.
    static Result Save(const std::string& path, const ExtractionState& state);
};

} // namespace arcnav
