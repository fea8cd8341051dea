#include "nav/archive_view.hpp"

#include "nav/path_resolver.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <zlib.h>

namespace arcnav {

namespace {

std::string StripTrailingSlash(std::string_view s) {
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return std::string(s);
}

std::string LowerAscii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Returns the offset of the first malformed sequence, or npos.
size_t FindInvalidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return i;
        }
        if (i + len > s.size()) return i;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return i;
        }
        i += len;
    }
    return std::string_view::npos;
}

std::string Latin1ToUtf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(ch);
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

} // namespace

Result ArchiveView::Open(const std::string& archive_path, ArchiveView& out) {
    out.cwd_.clear();
    return ArchiveHandle::Open(archive_path, out.archive_);
}

void ArchiveView::Close() {
    archive_.Close();
    cwd_.clear();
}

std::string ArchiveView::Pwd() const { return PathResolver::Render(cwd_); }

Result ArchiveView::Resolve(std::string_view path, std::string& out) const {
    return PathResolver::Resolve(cwd_, path, out);
}

bool ArchiveView::HasPrefix(std::string_view prefix) const {
    const auto& members = archive_.Members();
    auto it = members.lower_bound(prefix);
    return it != members.end() && StartsWith(it->first, prefix);
}

ArchiveView::Kind ArchiveView::Classify(std::string_view canonical) const {
    if (canonical.empty()) return Kind::Directory;

    if (canonical.back() == '/') {
        return HasPrefix(canonical) ? Kind::Directory : Kind::Missing;
    }
    if (archive_.Find(canonical)) return Kind::File;
    if (HasPrefix(std::string(canonical) + "/")) return Kind::Directory;
    return Kind::Missing;
}

Result ArchiveView::Exists(std::string_view path, bool& out) const {
    std::string rel;
    if (auto r = Resolve(path, rel); !r.is_ok()) return r;
    out = Classify(rel) != Kind::Missing;
    return Result::Ok();
}

Result ArchiveView::IsDirectory(std::string_view path, bool& out) const {
    std::string rel;
    if (auto r = Resolve(path, rel); !r.is_ok()) return r;
    out = Classify(rel) == Kind::Directory;
    return Result::Ok();
}

Result ArchiveView::IsFile(std::string_view path, bool& out) const {
    std::string rel;
    if (auto r = Resolve(path, rel); !r.is_ok()) return r;
    out = Classify(rel) == Kind::File;
    return Result::Ok();
}

bool ArchiveView::Exists(std::string_view path) const {
    bool v = false;
    return Exists(path, v).is_ok() && v;
}

bool ArchiveView::IsDirectory(std::string_view path) const {
    bool v = false;
    return IsDirectory(path, v).is_ok() && v;
}

bool ArchiveView::IsFile(std::string_view path) const {
    bool v = false;
    return IsFile(path, v).is_ok() && v;
}

Result ArchiveView::List(std::string_view path,
                         bool recursive,
                         std::vector<std::string>& out) const {
    out.clear();

    std::string rel;
    if (auto r = Resolve(path, rel); !r.is_ok()) return r;

    std::string prefix;
    if (!rel.empty()) {
        prefix = StripTrailingSlash(rel) + "/";
        if (!HasPrefix(prefix)) {
            if (Classify(rel) == Kind::File) {
                return Result::Fail(ErrorCode::NotADirectory, "Not a directory: " + rel);
            }
            return Result::Fail(ErrorCode::NotFound, "No such directory: " + rel);
        }
    }

    std::set<std::string> entries;
    const auto& members = archive_.Members();
    for (auto it = members.lower_bound(prefix);
         it != members.end() && StartsWith(it->first, prefix); ++it) {
        const std::string_view rest = std::string_view(it->first).substr(prefix.size());
        if (rest.empty()) continue;

        size_t slash = rest.find('/');
        if (!recursive) {
            if (slash == std::string_view::npos) {
                entries.insert(prefix + std::string(rest));
            } else {
                entries.insert(prefix + std::string(rest.substr(0, slash + 1)));
            }
            continue;
        }

        while (slash != std::string_view::npos) {
            entries.insert(prefix + std::string(rest.substr(0, slash + 1)));
            slash = rest.find('/', slash + 1);
        }
        if (rest.back() != '/') entries.insert(prefix + std::string(rest));
    }

    out.assign(entries.begin(), entries.end());
    return Result::Ok();
}

Result ArchiveView::ChangeDirectory(std::string_view path, std::string& out_pwd) {
    std::string rel;
    if (auto r = Resolve(path, rel); !r.is_ok()) return r;

    if (rel.empty()) {
        cwd_.clear();
        out_pwd = Pwd();
        return Result::Ok();
    }

    const std::string dir = StripTrailingSlash(rel);
    if (HasPrefix(dir + "/")) {
        cwd_ = dir + "/";
        out_pwd = Pwd();
        LogDebug("cd %s", out_pwd.c_str());
        return Result::Ok();
    }

    if (archive_.Find(rel)) {
        return Result::Fail(ErrorCode::NotADirectory, "Not a directory: " + rel);
    }
    return Result::Fail(ErrorCode::NotFound, "No such directory: " + rel);
}

Result ArchiveView::SetCursor(std::string_view canonical) {
    std::string ignored;
    return ChangeDirectory("/" + std::string(canonical), ignored);
}

Result ArchiveView::ResolveFile(std::string_view path, std::string& rel) const {
    if (auto r = Resolve(path, rel); !r.is_ok()) return r;

    switch (Classify(rel)) {
        case Kind::File:
            return Result::Ok();
        case Kind::Directory:
            return Result::Fail(ErrorCode::IsADirectory,
                                "Is a directory: " + PathResolver::Render(rel));
        case Kind::Missing:
            break;
    }
    return Result::Fail(ErrorCode::NotFound, "No such file: " + rel);
}

Result ArchiveView::Read(std::string_view path, std::string& out) const {
    std::string rel;
    if (auto r = ResolveFile(path, rel); !r.is_ok()) return r;
    return archive_.ReadMember(rel, out);
}

Result ArchiveView::ReadText(std::string_view path,
                             std::string_view encoding,
                             std::string& out) const {
    const std::string enc = LowerAscii(encoding);
    const bool raw = enc.empty() || enc == "binary";
    const bool utf8 = enc == "utf-8" || enc == "utf8";
    const bool ascii = enc == "ascii" || enc == "us-ascii";
    const bool latin1 = enc == "latin-1" || enc == "latin1" || enc == "iso-8859-1";
    if (!raw && !utf8 && !ascii && !latin1) {
        return Result::Fail(ErrorCode::ValidationError,
                            "unknown encoding: " + std::string(encoding));
    }

    std::string bytes;
    if (auto r = Read(path, bytes); !r.is_ok()) return r;

    if (utf8) {
        if (const size_t bad = FindInvalidUtf8(bytes); bad != std::string_view::npos) {
            return Result::Fail(ErrorCode::ValidationError,
                                "invalid utf-8 at byte " + std::to_string(bad));
        }
    } else if (ascii) {
        auto it = std::find_if(bytes.begin(), bytes.end(), [](char c) {
            return static_cast<unsigned char>(c) >= 0x80;
        });
        if (it != bytes.end()) {
            return Result::Fail(ErrorCode::ValidationError,
                                "non-ascii byte at " + std::to_string(it - bytes.begin()));
        }
    } else if (latin1) {
        bytes = Latin1ToUtf8(bytes);
    }

    out = std::move(bytes);
    return Result::Ok();
}

Result ArchiveView::Info(std::string_view path, MemberInfo& out) const {
    std::string rel;
    if (auto r = ResolveFile(path, rel); !r.is_ok()) return r;

    const MemberInfo* info = archive_.Find(rel);
    out = *info;

    MemberReader reader;
    if (auto r = archive_.OpenMember(rel, reader); !r.is_ok()) return r;

    uLong crc = crc32(0L, Z_NULL, 0);
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            return Result::Fail(ErrorCode::ArchiveError, "read " + rel + ": " + reader.LastError());
        }
        crc = crc32(crc, buf.data(), static_cast<uInt>(n));
    }
    out.crc32 = static_cast<std::uint32_t>(crc);
    return Result::Ok();
}

std::vector<std::string> ArchiveView::ScanAllFilesUnder(std::string_view base) const {
    std::vector<std::string> out;

    std::string rel;
    if (!Resolve(base, rel).is_ok()) return out;

    std::string prefix;
    if (!rel.empty()) {
        prefix = StripTrailingSlash(rel) + "/";
        if (!HasPrefix(prefix)) return out;
    }

    const auto& members = archive_.Members();
    for (auto it = members.lower_bound(prefix);
         it != members.end() && StartsWith(it->first, prefix); ++it) {
        out.push_back(it->first);
    }
    return out;
}

} // namespace arcnav
