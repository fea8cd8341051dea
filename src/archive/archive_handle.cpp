#include "archive/archive_handle.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace arcnav {

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;

std::string EntryName(archive_entry* entry) {
    if (const char* utf8 = archive_entry_pathname_utf8(entry)) return utf8;
    if (const char* raw = archive_entry_pathname(entry)) return raw;
    return {};
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string Upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

// libarchive reports the per-entry ZIP method through the format name,
// e.g. "ZIP 2.0 (deflation)". Other formats are compressed as a whole
// stream, so the outermost filter is the method.
std::string CompressionName(archive* a) {
    const char* fmt = archive_format_name(a);
    const std::string name = fmt ? fmt : "";

    if ((archive_format(a) & ARCHIVE_FORMAT_BASE_MASK) == ARCHIVE_FORMAT_ZIP) {
        if (Contains(name, "uncompressed")) return "STORED";
        if (Contains(name, "deflation")) return "DEFLATED";
        if (Contains(name, "bzip2")) return "BZIP2";
        if (Contains(name, "lzma")) return "LZMA";
        if (Contains(name, "xz")) return "XZ";
        if (Contains(name, "zstd")) return "ZSTD";
        return name;
    }

    if (archive_filter_count(a) <= 1 || archive_filter_code(a, 0) == ARCHIVE_FILTER_NONE) {
        return "STORED";
    }
    const char* filter = archive_filter_name(a, 0);
    return filter ? Upper(filter) : name;
}

} // namespace

std::string ArchiveErr(archive* a) {
    const char* s = a ? archive_error_string(a) : nullptr;
    return s ? s : "unknown";
}

// Positional view of the archive descriptor owned by one decoder.
struct MemberReader::Source {
    int fd = -1;
    std::int64_t size = 0;
    std::int64_t pos = 0;
    std::vector<std::uint8_t> buf = std::vector<std::uint8_t>(kReadBlockSize);

    static la_ssize_t Read(archive* a, void* p, const void** out) {
        auto* s = static_cast<Source*>(p);
        while (true) {
            const ssize_t n = ::pread(s->fd, s->buf.data(), s->buf.size(), s->pos);
            if (n >= 0) {
                s->pos += n;
                *out = s->buf.data();
                return n;
            }
            if (errno == EINTR) continue;
            archive_set_error(a, errno, "cannot read archive file: %s", std::strerror(errno));
            return ARCHIVE_FATAL;
        }
    }

    static la_int64_t Seek(archive*, void* p, la_int64_t offset, int whence) {
        auto* s = static_cast<Source*>(p);
        switch (whence) {
            case SEEK_SET: s->pos = offset; break;
            case SEEK_CUR: s->pos += offset; break;
            case SEEK_END: s->pos = s->size + offset; break;
            default: return ARCHIVE_FATAL;
        }
        return s->pos;
    }

    static la_int64_t Skip(archive*, void* p, la_int64_t delta) {
        auto* s = static_cast<Source*>(p);
        s->pos += delta;
        return delta;
    }
};

MemberReader::MemberReader() = default;

MemberReader::MemberReader(MemberReader&& other) noexcept
    : src_(std::move(other.src_)), ar_(std::move(other.ar_)), entry_(other.entry_),
      err_(std::move(other.err_)), strict_(other.strict_) {
    other.entry_ = nullptr;
}

MemberReader& MemberReader::operator=(MemberReader&& other) noexcept {
    if (this != &other) {
        // The decoder references the source, so it goes first.
        ar_.reset();
        src_ = std::move(other.src_);
        ar_ = std::move(other.ar_);
        entry_ = other.entry_;
        err_ = std::move(other.err_);
        strict_ = other.strict_;
        other.entry_ = nullptr;
    }
    return *this;
}

MemberReader::~MemberReader() { ar_.reset(); }

ssize_t MemberReader::Read(std::span<std::uint8_t> out) {
    if (!ar_ || !entry_) {
        err_ = "member reader is not open";
        return -1;
    }

    while (true) {
        const la_ssize_t n = archive_read_data(ar_.get(), out.data(), out.size());
        if (n >= 0) return static_cast<ssize_t>(n);
        if (n == ARCHIVE_WARN && !strict_) {
            LogWarn("%s: %s", EntryName(entry_).c_str(), ArchiveErr(ar_.get()).c_str());
            continue;
        }
        err_ = ArchiveErr(ar_.get());
        return -1;
    }
}

Result MemberReader::NextFile(bool& end) {
    end = false;
    entry_ = nullptr;
    if (!ar_) return Result::Fail(ErrorCode::ArchiveError, "member reader is not open");

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar_.get(), &entry);
        if (r == ARCHIVE_EOF) {
            end = true;
            return Result::Ok();
        }
        if (r < ARCHIVE_WARN) {
            return Result::Fail(ErrorCode::ArchiveError,
                                "archive_read_next_header: " + ArchiveErr(ar_.get()));
        }
        if (r == ARCHIVE_WARN) LogWarn("%s", ArchiveErr(ar_.get()).c_str());
        if (archive_entry_filetype(entry) == AE_IFREG && !EntryName(entry).empty()) {
            entry_ = entry;
            return Result::Ok();
        }
    }
}

std::string MemberReader::Name() const { return entry_ ? EntryName(entry_) : std::string(); }

std::optional<std::uint64_t> MemberReader::TotalSize() const {
    if (!entry_ || !archive_entry_size_is_set(entry_)) return std::nullopt;
    const la_int64_t sz = archive_entry_size(entry_);
    if (sz < 0) return std::nullopt;
    return static_cast<std::uint64_t>(sz);
}

Result ArchiveHandle::Open(const std::string& path, ArchiveHandle& out) {
    out.Close();

    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) {
        return Result::Fail(ErrorCode::IoError, ec.value(),
                            "cannot resolve archive path " + path + ": " + ec.message());
    }
    out.path_ = abs.lexically_normal().string();

    if (auto r = Fd::Open(out.path_, O_RDONLY, 0, out.fd_); !r.is_ok()) return r;

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) != 0) {
        const int err = errno;
        out.Close();
        return Result::Fail(ErrorCode::IoError, err,
                            "fstat failed: " + path + " (" + std::strerror(err) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        out.Close();
        return Result::Fail(ErrorCode::NotFound, "not a regular file: " + out.path_);
    }
    out.file_size_ = static_cast<std::uint64_t>(st.st_size);

    if (auto r = out.BuildIndex(); !r.is_ok()) {
        out.Close();
        return r;
    }

    LogInfo("opened %s: %zu members", out.path_.c_str(), out.members_.size());
    return Result::Ok();
}

void ArchiveHandle::Close() {
    fd_.Close();
    members_.clear();
    file_size_ = 0;
    decoders_opened_ = 0;
}

const MemberInfo* ArchiveHandle::Find(std::string_view name) const {
    auto it = members_.find(name);
    return it == members_.end() ? nullptr : &it->second;
}

Result ArchiveHandle::OpenDecoder(MemberReader& out) const {
    if (!IsOpen()) return Result::Fail(ErrorCode::ArchiveError, "archive is closed");

    out = MemberReader{};
    out.src_ = std::make_unique<MemberReader::Source>();
    out.src_->fd = fd_.Get();
    out.src_->size = static_cast<std::int64_t>(file_size_);

    out.ar_.reset(archive_read_new());
    archive* a = out.ar_.get();
    if (!a) return Result::Fail(ErrorCode::ArchiveError, "archive_read_new failed");
    ++decoders_opened_;

    archive_read_support_filter_all(a);
    archive_read_support_format_7zip(a);
    archive_read_support_format_ar(a);
    archive_read_support_format_cab(a);
    archive_read_support_format_cpio(a);
    archive_read_support_format_iso9660(a);
    archive_read_support_format_lha(a);
    archive_read_support_format_rar(a);
    archive_read_support_format_rar5(a);
    archive_read_support_format_tar(a);
    archive_read_support_format_xar(a);
    // ZIP is read through its central directory only.
    archive_read_support_format_zip_seekable(a);

    archive_read_set_callback_data(a, out.src_.get());
    archive_read_set_read_callback(a, MemberReader::Source::Read);
    archive_read_set_seek_callback(a, MemberReader::Source::Seek);
    archive_read_set_skip_callback(a, MemberReader::Source::Skip);

    if (archive_read_open1(a) != ARCHIVE_OK) {
        return Result::Fail(ErrorCode::ArchiveError,
                            "cannot open archive " + path_ + ": " + ArchiveErr(a));
    }
    return Result::Ok();
}

Result ArchiveHandle::BuildIndex() {
    MemberReader dec;
    if (auto r = OpenDecoder(dec); !r.is_ok()) return r;

    archive* a = dec.Native();
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("%s: %s", path_.c_str(), ArchiveErr(a).c_str());
        } else if (r != ARCHIVE_OK) {
            return Result::Fail(ErrorCode::ArchiveError,
                                "archive_read_next_header: " + ArchiveErr(a));
        }

        const std::string name = EntryName(entry);
        if (name.empty() || archive_entry_filetype(entry) != AE_IFREG) {
            LogDebug("index: skipping non-file entry '%s'", name.c_str());
            continue;
        }

        MemberInfo info;
        info.name = name;
        info.size = archive_entry_size_is_set(entry)
                        ? static_cast<std::uint64_t>(archive_entry_size(entry))
                        : 0;
        info.mtime = archive_entry_mtime_is_set(entry)
                         ? static_cast<std::int64_t>(archive_entry_mtime(entry))
                         : 0;
        info.compression = CompressionName(a);
        if (info.compression == "STORED") info.compressed_size = info.size;

        if (!members_.emplace(name, std::move(info)).second) {
            LogWarn("index: duplicate member '%s', keeping the first", name.c_str());
        }
    }

    return Result::Ok();
}

Result ArchiveHandle::OpenStream(MemberReader& out) const {
    return OpenDecoder(out);
}

Result ArchiveHandle::OpenMember(std::string_view name, MemberReader& out) const {
    if (!Find(name)) {
        return Result::Fail(ErrorCode::NotFound, "no such member: " + std::string(name));
    }

    if (auto r = OpenDecoder(out); !r.is_ok()) return r;

    while (true) {
        bool end = false;
        if (auto r = out.NextFile(end); !r.is_ok()) return r;
        if (end) break;
        if (out.Name() == name) return Result::Ok();
    }

    return Result::Fail(ErrorCode::NotFound,
                        "member vanished from archive: " + std::string(name));
}

Result ArchiveHandle::ReadMember(std::string_view name, std::string& out) const {
    MemberReader reader;
    if (auto r = OpenMember(name, reader); !r.is_ok()) return r;

    out.clear();
    if (auto total = reader.TotalSize()) out.reserve(static_cast<size_t>(*total));

    std::vector<std::uint8_t> buf(kReadBlockSize);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            return Result::Fail(ErrorCode::ArchiveError,
                                "read " + std::string(name) + ": " + reader.LastError());
        }
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace arcnav
