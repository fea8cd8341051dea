#pragma once

#include "extract/extraction_state.hpp"
#include "extract/member_extractor.hpp"
#include "nav/archive_view.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arcnav {

// Space required for a batch: sum(sizes) * (1 + margin_ratio) + headroom_bytes.
struct PreflightPolicy {
    double margin_ratio = 0.05;
    std::uint64_t headroom_bytes = 16ULL * 1024 * 1024;
};

struct ExtractionStatus {
    bool active = false;
    std::string archive;
    std::string base_directory;
    std::size_t batch_size = 0;
    std::uint64_t seed = 0;
    std::optional<std::vector<std::string>> extensions;
    std::size_t total = 0;
    std::size_t extracted = 0;
    std::size_t remaining = 0;
    std::size_t failed_count = 0;
    std::vector<std::string> recent_failures;
    std::string extract_dir;
    std::string state_file;
    std::string on_error;
    int max_retries = 0;
    bool validate_crc = false;
};

nlohmann::json StatusToJson(const ExtractionStatus& status);

// Resumable batched extraction of the files below the view's current
// directory.
//
//   Uninitialized --Initialize/Resume--> Active --end of order--> Exhausted
//   any state --Reset--> Uninitialized
//
// The extraction directory holds at most one batch at a time: each
// NextBatch() clears it before writing. Progress is persisted after every
// batch so a later process can Resume(). Two extractors sharing one
// extraction directory are not coordinated in any way.
class BatchExtractor {
  public:
    enum class State { Uninitialized, Active, Exhausted };

    class IExtractionOps {
      public:
        virtual ~IExtractionOps() = default;
        virtual Result ExtractRaw(const ArchiveHandle& source,
                                  const std::string& member,
                                  const std::string& dest_path) const = 0;
        virtual Result ExtractVerified(const ArchiveHandle& source,
                                       const std::string& member,
                                       const std::string& dest_path) const = 0;
        // First attempt for a whole batch; see MemberExtractor::ExtractBatch.
        virtual void ExtractBatch(const ArchiveHandle& source,
                                  std::vector<BatchItem>& items,
                                  bool verified) const = 0;
        virtual Result FreeSpace(const std::string& dir, std::uint64_t& out) const = 0;
    };

    struct InitOptions {
        std::string output_dir;
        std::int64_t batch_size = 100;
        std::string subdir = "extracted_archive";
        bool reset = false;
        std::optional<std::uint64_t> seed;
        std::optional<std::vector<std::string>> extensions;
        ErrorPolicy on_error = ErrorPolicy::Skip;
        int max_retries = 1;
        bool validate_crc = false;
    };

    explicit BatchExtractor(ArchiveView& view);
    BatchExtractor(ArchiveView& view, std::shared_ptr<const IExtractionOps> ops);

    BatchExtractor(const BatchExtractor&) = delete;
    BatchExtractor& operator=(const BatchExtractor&) = delete;

    static std::shared_ptr<const IExtractionOps> DefaultOps();

    void SetPreflightPolicy(const PreflightPolicy& policy) { preflight_ = policy; }
    const PreflightPolicy& Preflight() const { return preflight_; }

    Result Initialize(const InitOptions& opt);
    Result Resume(const std::string& output_dir, const std::string& subdir);

    bool HasNext() const;
    // Extracts the next batch. At the end of the order `exhausted` is set
    // and `out` is empty; that is not an error.
    Result NextBatch(std::vector<std::string>& out, bool& exhausted);

    ExtractionStatus Status() const;
    Result Reset();
    // Forgets the in-memory run; the saved state stays resumable.
    void Close();

    State CurrentState() const { return state_; }
    const ExtractionState& Snapshot() const { return st_; }

  private:
    static Result ExtractionPaths(const std::string& output_dir,
                                  const std::string& subdir,
                                  std::string& extract_dir,
                                  std::string& state_path);
    void Adopt(ExtractionState&& loaded);
    Result ClearExtractDir() const;
    Result CheckFreeSpace(const std::vector<std::string>& batch) const;
    // `first` is the outcome of the batch pass, if it reached the member.
    Result ExtractWithRetries(const std::string& member,
                              const std::string& dest,
                              const std::optional<Result>& first) const;

    ArchiveView& view_;
    std::shared_ptr<const IExtractionOps> ops_;
    PreflightPolicy preflight_{};

    State state_ = State::Uninitialized;
    ExtractionState st_{};
    std::string extract_dir_;
    std::string state_path_;
};

} // namespace arcnav
