#pragma once

#include "archive/archive_handle.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arcnav {

struct BatchItem {
    std::string member;
    std::string dest_path;
    std::optional<Result> outcome;
};

// Writes a single archive member to a file on disk. Failures are reported
// as ExtractionFailure and leave no partial file behind.
class MemberExtractor {
  public:
    struct Options {
        std::size_t chunk_size = 1024 * 1024;
    };

    MemberExtractor() = default;
    explicit MemberExtractor(const Options& opt) : opt_(opt) {}

    // Hands the entry to libarchive's disk writer. Library warnings (a CRC
    // mismatch on some formats) are logged, not fatal.
    Result ExtractRaw(const ArchiveHandle& source,
                      std::string_view member,
                      const std::string& dest_path) const;

    // Streams decompressed bytes in chunks; any library warning or a size
    // mismatch fails the extraction.
    Result ExtractVerified(const ArchiveHandle& source,
                           std::string_view member,
                           const std::string& dest_path) const;

    // Extracts every item in a single pass over one decoder. Items whose
    // member was not reached (absent, or the stream broke first) keep an
    // empty outcome.
    void ExtractBatch(const ArchiveHandle& source,
                      std::vector<BatchItem>& items,
                      bool verified) const;

  private:
    Result WriteRaw(MemberReader& reader, std::string_view member, const std::string& dest_path) const;
    Result WriteVerified(MemberReader& reader, std::string_view member, const std::string& dest_path) const;

    Options opt_{};
};

} // namespace arcnav
