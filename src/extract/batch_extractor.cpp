#include "extract/batch_extractor.hpp"

#include "archive/archive_path_policy.hpp"
#include "extract/member_extractor.hpp"
#include "extract/shuffle.hpp"
#include "nav/path_resolver.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace arcnav {

namespace {

constexpr std::size_t kRecentFailures = 10;

class PosixExtractionOps final : public BatchExtractor::IExtractionOps {
  public:
    Result ExtractRaw(const ArchiveHandle& source,
                      const std::string& member,
                      const std::string& dest_path) const override {
        return extractor_.ExtractRaw(source, member, dest_path);
    }

    Result ExtractVerified(const ArchiveHandle& source,
                           const std::string& member,
                           const std::string& dest_path) const override {
        return extractor_.ExtractVerified(source, member, dest_path);
    }

    void ExtractBatch(const ArchiveHandle& source,
                      std::vector<BatchItem>& items,
                      bool verified) const override {
        extractor_.ExtractBatch(source, items, verified);
    }

    Result FreeSpace(const std::string& dir, std::uint64_t& out) const override {
        struct statvfs vfs{};
        if (::statvfs(dir.c_str(), &vfs) != 0) {
            const int err = errno;
            return Result::Fail(ErrorCode::IoError, err,
                                "statvfs " + dir + " failed (" + std::strerror(err) + ")");
        }
        out = static_cast<std::uint64_t>(vfs.f_bavail) * static_cast<std::uint64_t>(vfs.f_frsize);
        return Result::Ok();
    }

  private:
    MemberExtractor extractor_;
};

bool IsStateFile(const fs::path& p) {
    const std::string name = p.filename().string();
    const std::string state = ExtractionStateStore::kFileName;
    return name == state || name == state + ".tmp";
}

std::string Megabytes(std::uint64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(bytes) / 1e6);
    return buf;
}

} // namespace

nlohmann::json StatusToJson(const ExtractionStatus& s) {
    nlohmann::json j = nlohmann::json::object();
    j["active"] = s.active;
    if (!s.active) return j;

    j["archive"] = s.archive;
    j["base_directory"] = s.base_directory;
    j["batch_size"] = s.batch_size;
    j["seed"] = s.seed;
    j["extensions"] = s.extensions ? nlohmann::json(*s.extensions) : nlohmann::json(nullptr);
    j["total_files"] = s.total;
    j["extracted_so_far"] = s.extracted;
    j["remaining"] = s.remaining;
    j["failed_so_far"] = s.failed_count;
    j["recent_failures"] = s.recent_failures;
    j["extract_dir"] = s.extract_dir;
    j["state_file"] = s.state_file;
    j["on_error"] = s.on_error;
    j["max_retries"] = s.max_retries;
    j["validate_crc"] = s.validate_crc;
    return j;
}

std::shared_ptr<const BatchExtractor::IExtractionOps> BatchExtractor::DefaultOps() {
    static const std::shared_ptr<const IExtractionOps> kDefault =
        std::make_shared<PosixExtractionOps>();
    return kDefault;
}

BatchExtractor::BatchExtractor(ArchiveView& view) : view_(view), ops_(DefaultOps()) {}

BatchExtractor::BatchExtractor(ArchiveView& view, std::shared_ptr<const IExtractionOps> ops)
    : view_(view), ops_(ops ? std::move(ops) : DefaultOps()) {}

Result BatchExtractor::ExtractionPaths(const std::string& output_dir,
                                       const std::string& subdir,
                                       std::string& extract_dir,
                                       std::string& state_path) {
    const auto segs = NormalizeSegments(NormalizeSeparators(subdir));
    if (segs.empty() || segs.front() == ".." || (!subdir.empty() && subdir.front() == '/')) {
        return Result::Fail(ErrorCode::ValidationError,
                            "extraction subdirectory must be a relative path below the output "
                            "directory, got '" + subdir + "'");
    }

    std::error_code ec;
    const fs::path abs = fs::absolute(fs::path(output_dir) / subdir, ec);
    if (ec) {
        return Result::Fail(ErrorCode::IoError, ec.value(),
                            "cannot resolve " + output_dir + ": " + ec.message());
    }
    extract_dir = abs.lexically_normal().string();
    while (extract_dir.size() > 1 && extract_dir.back() == '/') extract_dir.pop_back();
    state_path = (fs::path(extract_dir) / ExtractionStateStore::kFileName).string();
    return Result::Ok();
}

void BatchExtractor::Adopt(ExtractionState&& loaded) {
    st_ = std::move(loaded);
    st_.extract_dir = extract_dir_;
    state_ = st_.cursor < st_.order.size() ? State::Active : State::Exhausted;
}

Result BatchExtractor::Initialize(const InitOptions& opt) {
    if (opt.batch_size <= 0) {
        return Result::Fail(ErrorCode::ValidationError, "batch_size must be > 0");
    }
    if (opt.max_retries < 0 || opt.max_retries > kMaxRetriesLimit) {
        return Result::Fail(ErrorCode::ValidationError,
                            "max_retries must be in [0, " + std::to_string(kMaxRetriesLimit) + "]");
    }
    if (!view_.IsOpen()) {
        return Result::Fail(ErrorCode::ValidationError, "archive is not open");
    }

    std::string extract_dir;
    std::string state_path;
    if (auto r = ExtractionPaths(opt.output_dir, opt.subdir, extract_dir, state_path); !r.is_ok()) {
        return r;
    }
    const auto exts = NormalizeExtensions(opt.extensions);

    std::error_code ec;
    if (opt.reset) {
        fs::remove_all(extract_dir, ec);
        if (ec) {
            return Result::Fail(ErrorCode::IoError, ec.value(),
                                "cannot remove " + extract_dir + ": " + ec.message());
        }
    }
    fs::create_directories(extract_dir, ec);
    if (ec) {
        return Result::Fail(ErrorCode::IoError, ec.value(),
                            "cannot create " + extract_dir + ": " + ec.message());
    }

    if (!opt.reset && fs::is_regular_file(state_path, ec)) {
        ExtractionState loaded;
        if (auto r = ExtractionStateStore::Load(state_path, loaded); !r.is_ok()) return r;

        if (loaded.archive_identity != view_.Archive().Path()) {
            return Result::Fail(ErrorCode::StateConflict,
                                "State belongs to a different archive: " + loaded.archive_identity);
        }
        if (loaded.base_directory != view_.Cursor()) {
            return Result::Fail(ErrorCode::StateConflict,
                                "State was created at " + PathResolver::Render(loaded.base_directory) +
                                    ", current directory is " + view_.Pwd());
        }
        if (loaded.extensions != exts) {
            return Result::Fail(ErrorCode::StateConflict,
                                "Extension filter differs from the saved one");
        }

        extract_dir_ = extract_dir;
        state_path_ = state_path;
        Adopt(std::move(loaded));
        LogInfo("continuing saved run in %s: %zu/%zu extracted",
                extract_dir_.c_str(), st_.cursor, st_.order.size());
        return Result::Ok();
    }

    std::vector<std::string> candidates;
    for (auto& name : view_.ScanAllFilesUnder(view_.Pwd())) {
        if (!ArchivePathPolicy::IsSafeMember(name)) {
            LogWarn("excluding unsafe member '%s'", name.c_str());
            continue;
        }
        if (!exts.empty() && !std::binary_search(exts.begin(), exts.end(), LowerExtension(name))) {
            continue;
        }
        candidates.push_back(std::move(name));
    }
    if (candidates.empty()) {
        return Result::Fail(ErrorCode::NotFound,
                            "No files found under " + view_.Pwd() + " with the requested filter");
    }

    ExtractionState fresh;
    fresh.archive_identity = view_.Archive().Path();
    fresh.base_directory = view_.Cursor();
    fresh.seed = opt.seed ? *opt.seed : DrawSeed();
    fresh.order = std::move(candidates);
    DeterministicShuffle(fresh.order, fresh.seed);
    fresh.cursor = 0;
    fresh.batch_size = static_cast<std::size_t>(opt.batch_size);
    fresh.extensions = exts;
    fresh.on_error = opt.on_error;
    fresh.max_retries = opt.max_retries;
    fresh.validate_crc = opt.validate_crc;
    fresh.extract_dir = extract_dir;

    if (auto r = ExtractionStateStore::Save(state_path, fresh); !r.is_ok()) return r;

    extract_dir_ = extract_dir;
    state_path_ = state_path;
    Adopt(std::move(fresh));
    LogInfo("new run: %zu files, batch size %zu, seed %llu",
            st_.order.size(), st_.batch_size, (unsigned long long)st_.seed);
    return Result::Ok();
}

Result BatchExtractor::Resume(const std::string& output_dir, const std::string& subdir) {
    if (!view_.IsOpen()) {
        return Result::Fail(ErrorCode::ValidationError, "archive is not open");
    }

    std::string extract_dir;
    std::string state_path;
    if (auto r = ExtractionPaths(output_dir, subdir, extract_dir, state_path); !r.is_ok()) {
        return r;
    }

    ExtractionState loaded;
    if (auto r = ExtractionStateStore::Load(state_path, loaded); !r.is_ok()) return r;

    if (loaded.archive_identity != view_.Archive().Path()) {
        return Result::Fail(ErrorCode::StateConflict,
                            "State belongs to a different archive: " + loaded.archive_identity);
    }

    if (view_.Cursor() != loaded.base_directory) {
        if (auto r = view_.SetCursor(loaded.base_directory); !r.is_ok()) {
            return Result::Fail(ErrorCode::StateConflict,
                                "saved base directory is not in the archive: " + r.msg);
        }
    }

    extract_dir_ = extract_dir;
    state_path_ = state_path;
    Adopt(std::move(loaded));
    LogInfo("resumed %s: %zu/%zu extracted, %zu failed",
            state_path_.c_str(), st_.cursor, st_.order.size(), st_.failed.size());
    return Result::Ok();
}

bool BatchExtractor::HasNext() const {
    return state_ == State::Active && st_.cursor < st_.order.size();
}

Result BatchExtractor::ClearExtractDir() const {
    std::error_code ec;
    fs::directory_iterator it(extract_dir_, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) return Result::Ok();
        return Result::Fail(ErrorCode::IoError, ec.value(),
                            "cannot list " + extract_dir_ + ": " + ec.message());
    }

    std::vector<fs::path> doomed;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!IsStateFile(it->path())) doomed.push_back(it->path());
    }
    if (ec) {
        return Result::Fail(ErrorCode::IoError, ec.value(),
                            "cannot list " + extract_dir_ + ": " + ec.message());
    }

    for (const auto& path : doomed) {
        std::error_code rm_ec;
        fs::remove_all(path, rm_ec);
        if (rm_ec && rm_ec != std::errc::no_such_file_or_directory) {
            return Result::Fail(ErrorCode::IoError, rm_ec.value(),
                                "cannot remove " + path.string() + ": " + rm_ec.message());
        }
    }
    return Result::Ok();
}

Result BatchExtractor::CheckFreeSpace(const std::vector<std::string>& batch) const {
    std::uint64_t total = 0;
    for (const auto& m : batch) {
        if (const MemberInfo* info = view_.Archive().Find(m)) total += info->size;
    }

    const long double scaled = static_cast<long double>(total) * (1.0L + preflight_.margin_ratio);
    const std::uint64_t needed = static_cast<std::uint64_t>(scaled) + preflight_.headroom_bytes;

    std::uint64_t free_bytes = 0;
    if (auto r = ops_->FreeSpace(extract_dir_, free_bytes); !r.is_ok()) return r;

    if (free_bytes < needed) {
        return Result::Fail(ErrorCode::InsufficientSpace,
                            "Insufficient free space in " + extract_dir_ + ": need ~" +
                                Megabytes(needed) + " MB, have ~" + Megabytes(free_bytes) + " MB");
    }
    return Result::Ok();
}

Result BatchExtractor::ExtractWithRetries(const std::string& member,
                                          const std::string& dest,
                                          const std::optional<Result>& first) const {
    const int attempts = st_.max_retries + 1;
    Result last;
    int attempt = 1;
    if (first) {
        if (first->is_ok()) return *first;
        last = *first;
        LogWarn("attempt 1/%d for %s failed: %s", attempts, member.c_str(), last.msg.c_str());
        ++attempt;
    }
    for (; attempt <= attempts; ++attempt) {
        last = st_.validate_crc ? ops_->ExtractVerified(view_.Archive(), member, dest)
                                : ops_->ExtractRaw(view_.Archive(), member, dest);
        if (last.is_ok()) {
            LogDebug("extracted %s", member.c_str());
            return last;
        }
        LogWarn("attempt %d/%d for %s failed: %s", attempt, attempts, member.c_str(), last.msg.c_str());
    }
    return Result::Fail(ErrorCode::ExtractionFailure, "Error extracting " + member + ": " + last.msg);
}

Result BatchExtractor::NextBatch(std::vector<std::string>& out, bool& exhausted) {
    out.clear();
    exhausted = false;

    if (state_ == State::Uninitialized) {
        return Result::Fail(ErrorCode::ValidationError,
                            "iterator not initialized: call Initialize or Resume first");
    }
    if (st_.cursor >= st_.order.size()) {
        state_ = State::Exhausted;
        exhausted = true;
        return Result::Ok();
    }

    const std::size_t start = st_.cursor;
    const std::size_t end = start + std::min(st_.batch_size, st_.order.size() - start);
    const std::vector<std::string> batch(st_.order.begin() + static_cast<std::ptrdiff_t>(start),
                                         st_.order.begin() + static_cast<std::ptrdiff_t>(end));
    LogInfo("batch [%zu, %zu) of %zu", start, end, st_.order.size());

    if (auto r = ClearExtractDir(); !r.is_ok()) return r;
    if (auto r = CheckFreeSpace(batch); !r.is_ok()) return r;

    // Unsafe names fail on their own; the rest share one pass over the archive.
    std::vector<Result> rejected(batch.size());
    std::vector<BatchItem> items;
    std::vector<std::size_t> item_of(batch.size(), batch.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        std::string dest;
        rejected[i] = ArchivePathPolicy::TargetPath(extract_dir_, batch[i], dest);
        if (!rejected[i].is_ok()) continue;
        item_of[i] = items.size();
        items.push_back(BatchItem{batch[i], std::move(dest), std::nullopt});
    }
    ops_->ExtractBatch(view_.Archive(), items, st_.validate_crc);

    const bool abort = st_.on_error == ErrorPolicy::Abort;
    std::vector<std::string> written;
    std::vector<std::string> failed_now;

    for (std::size_t i = 0; i < batch.size(); ++i) {
        const std::string& member = batch[i];
        Result r = rejected[i];
        if (r.is_ok()) {
            const BatchItem& item = items[item_of[i]];
            r = ExtractWithRetries(item.member, item.dest_path, item.outcome);
            if (r.is_ok()) {
                written.push_back(item.dest_path);
                continue;
            }
        }

        if (abort) {
            LogError("aborting batch: %s", r.msg.c_str());
            return r;
        }
        LogWarn("skipping %s (%s)", member.c_str(), ErrorCodeName(r.code));
        failed_now.push_back(member);
    }

    const std::size_t failed_before = st_.failed.size();
    for (auto& f : failed_now) {
        if (std::find(st_.failed.begin(), st_.failed.end(), f) == st_.failed.end()) {
            st_.failed.push_back(std::move(f));
        }
    }
    st_.cursor = end;

    if (auto r = ExtractionStateStore::Save(state_path_, st_); !r.is_ok()) {
        st_.cursor = start;
        st_.failed.resize(failed_before);
        return r;
    }

    out = std::move(written);
    return Result::Ok();
}

ExtractionStatus BatchExtractor::Status() const {
    ExtractionStatus s;
    if (state_ == State::Uninitialized) return s;

    s.active = true;
    s.archive = st_.archive_identity;
    s.base_directory = st_.base_directory.empty() ? "/" : st_.base_directory;
    s.batch_size = st_.batch_size;
    s.seed = st_.seed;
    if (!st_.extensions.empty()) s.extensions = st_.extensions;
    s.total = st_.order.size();
    s.extracted = st_.cursor;
    s.remaining = s.total > s.extracted ? s.total - s.extracted : 0;
    s.failed_count = st_.failed.size();
    const std::size_t tail = std::min(kRecentFailures, st_.failed.size());
    s.recent_failures.assign(st_.failed.end() - static_cast<std::ptrdiff_t>(tail), st_.failed.end());
    s.extract_dir = extract_dir_;
    s.state_file = state_path_;
    s.on_error = ErrorPolicyName(st_.on_error);
    s.max_retries = st_.max_retries;
    s.validate_crc = st_.validate_crc;
    return s;
}

Result BatchExtractor::Reset() {
    if (!extract_dir_.empty()) {
        if (auto r = ClearExtractDir(); !r.is_ok()) return r;

        for (const std::string& p : {state_path_, state_path_ + ".tmp"}) {
            std::error_code ec;
            fs::remove(p, ec);
            if (ec && ec != std::errc::no_such_file_or_directory) {
                return Result::Fail(ErrorCode::IoError, ec.value(),
                                    "cannot remove " + p + ": " + ec.message());
            }
        }
        LogInfo("reset %s", extract_dir_.c_str());
    }
    Close();
    return Result::Ok();
}

void BatchExtractor::Close() {
    state_ = State::Uninitialized;
    st_ = ExtractionState{};
    extract_dir_.clear();
    state_path_.clear();
}

} // namespace arcnav
