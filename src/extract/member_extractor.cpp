#include "extract/member_extractor.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <memory>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace arcnav {

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

Result Fail(std::string_view member, const std::string& what) {
    return Result::Fail(ErrorCode::ExtractionFailure, std::string(member) + ": " + what);
}

Result PrepareParent(std::string_view member, const std::string& dest_path) {
    std::error_code ec;
    const fs::path parent = fs::path(dest_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec) return Fail(member, "cannot create " + parent.string() + ": " + ec.message());
    return Result::Ok();
}

void RemovePartial(const std::string& dest_path) {
    std::error_code ec;
    fs::remove(dest_path, ec);
}

} // namespace

Result MemberExtractor::ExtractRaw(const ArchiveHandle& source,
                                   std::string_view member,
                                   const std::string& dest_path) const {
    MemberReader reader;
    if (auto r = source.OpenMember(member, reader); !r.is_ok()) return Fail(member, r.msg);
    return WriteRaw(reader, member, dest_path);
}

Result MemberExtractor::ExtractVerified(const ArchiveHandle& source,
                                        std::string_view member,
                                        const std::string& dest_path) const {
    MemberReader reader;
    if (auto r = source.OpenMember(member, reader); !r.is_ok()) return Fail(member, r.msg);
    return WriteVerified(reader, member, dest_path);
}

void MemberExtractor::ExtractBatch(const ArchiveHandle& source,
                                   std::vector<BatchItem>& items,
                                   bool verified) const {
    std::unordered_map<std::string_view, std::size_t> pending;
    for (std::size_t i = 0; i < items.size(); ++i) {
        items[i].outcome.reset();
        pending.emplace(items[i].member, i);
    }
    if (pending.empty()) return;

    MemberReader reader;
    if (auto r = source.OpenStream(reader); !r.is_ok()) {
        LogWarn("batch pass: %s", r.msg.c_str());
        return;
    }

    while (!pending.empty()) {
        bool end = false;
        if (auto r = reader.NextFile(end); !r.is_ok()) {
            LogWarn("batch pass stopped with %zu members left: %s", pending.size(), r.msg.c_str());
            return;
        }
        if (end) break;

        const std::string name = reader.Name();
        auto it = pending.find(name);
        if (it == pending.end()) continue;

        BatchItem& item = items[it->second];
        pending.erase(it);
        item.outcome = verified ? WriteVerified(reader, item.member, item.dest_path)
                                : WriteRaw(reader, item.member, item.dest_path);
    }

    if (!pending.empty()) LogDebug("batch pass: %zu members not found", pending.size());
}

Result MemberExtractor::WriteRaw(MemberReader& reader,
                                 std::string_view member,
                                 const std::string& dest_path) const {
    if (auto r = PrepareParent(member, dest_path); !r.is_ok()) return r;

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Fail(member, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // The entry is retargeted to an absolute path below the extraction
    // directory, so NOABSOLUTEPATHS would reject every write.
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    archive_entry* entry = reader.Entry();
    archive_entry_set_pathname(entry, dest_path.c_str());

    auto fail = [&](const std::string& what) {
        RemovePartial(dest_path);
        return Fail(member, what);
    };

    const int hr = archive_write_header(aw.get(), entry);
    if (hr < ARCHIVE_WARN) return fail("archive_write_header: " + ArchiveErr(aw.get()));
    if (hr == ARCHIVE_WARN) {
        LogWarn("%s: %s", dest_path.c_str(), ArchiveErr(aw.get()).c_str());
    }

    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true) {
        const int rr = archive_read_data_block(reader.Native(), &buff, &size, &offset);
        if (rr == ARCHIVE_EOF) break;
        if (rr == ARCHIVE_WARN) {
            LogWarn("%.*s: %s", (int)member.size(), member.data(), ArchiveErr(reader.Native()).c_str());
        } else if (rr != ARCHIVE_OK) {
            return fail("archive_read_data_block: " + ArchiveErr(reader.Native()));
        }
        if (size == 0) continue;

        const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
        if (ww < ARCHIVE_OK) return fail("archive_write_data_block: " + ArchiveErr(aw.get()));
    }

    const int fr = archive_write_finish_entry(aw.get());
    if (fr < ARCHIVE_WARN) return fail("archive_write_finish_entry: " + ArchiveErr(aw.get()));
    if (fr == ARCHIVE_WARN) {
        LogWarn("%s: %s", dest_path.c_str(), ArchiveErr(aw.get()).c_str());
    }
    return Result::Ok();
}

Result MemberExtractor::WriteVerified(MemberReader& reader,
                                      std::string_view member,
                                      const std::string& dest_path) const {
    if (auto r = PrepareParent(member, dest_path); !r.is_ok()) return r;
    reader.SetStrict(true);

    FileWriter writer;
    if (auto r = FileWriter::Open(dest_path, writer); !r.is_ok()) return Fail(member, r.msg);

    auto fail = [&](const std::string& what) {
        writer.Close();
        RemovePartial(dest_path);
        return Fail(member, what);
    };

    std::vector<std::uint8_t> buf(opt_.chunk_size ? opt_.chunk_size : 1024 * 1024);
    std::uint64_t written = 0;

    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return fail("integrity check failed: " + reader.LastError());

        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return fail(wr.msg);
        written += static_cast<std::uint64_t>(n);
    }

    if (auto expected = reader.TotalSize(); expected && *expected != written) {
        return fail("size mismatch: expected " + std::to_string(*expected) + " bytes, got " +
                    std::to_string(written));
    }

    if (auto r = writer.FsyncNow(); !r.is_ok()) return fail(r.msg);
    writer.Close();
    return Result::Ok();
}

} // namespace arcnav
