#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace arcnav {

struct MemberInfo {
    std::string name;
    std::uint64_t size = 0;
    // Known only when the member is stored without compression.
    std::optional<std::uint64_t> compressed_size;
    std::int64_t mtime = 0;
    std::string compression;
    // Filled on demand by ArchiveView::Info.
    std::optional<std::uint32_t> crc32;
};

// Sorted by name so directory membership is a prefix range.
using MemberIndex = std::map<std::string, MemberInfo, std::less<>>;

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// Streams the decompressed bytes of one member. Each reader has its own
// libarchive decoder and its own offset into the shared descriptor, so
// several readers may be alive at once.
class MemberReader final : public IReader {
  public:
    MemberReader();
    MemberReader(const MemberReader&) = delete;
    MemberReader& operator=(const MemberReader&) = delete;
    MemberReader(MemberReader&& other) noexcept;
    MemberReader& operator=(MemberReader&& other) noexcept;
    ~MemberReader() override;

    // In strict mode any library warning (e.g. a CRC mismatch) fails Read().
    void SetStrict(bool strict) { strict_ = strict; }

    // Advances a stream opened with ArchiveHandle::OpenStream to the next
    // regular file. `end` is set once the archive has no more entries.
    Result NextFile(bool& end);
    std::string Name() const;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override;

    archive* Native() const { return ar_.get(); }
    archive_entry* Entry() const { return entry_; }
    const std::string& LastError() const { return err_; }

  private:
    friend class ArchiveHandle;

    struct Source;

    std::unique_ptr<Source> src_;
    ArchiveReadPtr ar_;
    archive_entry* entry_ = nullptr;
    std::string err_;
    bool strict_ = true;
};

// Read-only archive: an open descriptor plus the member index built once at
// open time. Only regular files become members; directories are inferred by
// callers from name prefixes.
class ArchiveHandle {
  public:
    static Result Open(const std::string& path, ArchiveHandle& out);

    ArchiveHandle() = default;
    ArchiveHandle(const ArchiveHandle&) = delete;
    ArchiveHandle& operator=(const ArchiveHandle&) = delete;
    ArchiveHandle(ArchiveHandle&&) noexcept = default;
    ArchiveHandle& operator=(ArchiveHandle&&) noexcept = default;
    ~ArchiveHandle() = default;

    bool IsOpen() const { return fd_.Valid(); }
    void Close();

    // Absolute, lexically normalized path of the archive file.
    const std::string& Path() const { return path_; }
    const MemberIndex& Members() const { return members_; }
    const MemberInfo* Find(std::string_view name) const;

    // A decoder positioned before the first entry; walk it with NextFile().
    Result OpenStream(MemberReader& out) const;
    Result OpenMember(std::string_view name, MemberReader& out) const;
    Result ReadMember(std::string_view name, std::string& out) const;

    // Decoders created since Open(), index pass included.
    std::size_t DecodersOpened() const { return decoders_opened_; }

  private:
    Result OpenDecoder(MemberReader& out) const;
    Result BuildIndex();

    std::string path_;
    Fd fd_;
    std::uint64_t file_size_ = 0;
    MemberIndex members_;
    mutable std::size_t decoders_opened_ = 0;
};

std::string ArchiveErr(archive* a);

} // namespace arcnav
