#pragma once

#include "archive/archive_handle.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace arcnav {

// Filesystem-like navigation over an archive's flat member list.
//
// Directories are never stored in the archive index: a path is a directory
// when it is the root or when some member name starts with "path/". A path
// without a trailing slash that is not a member but prefixes members is
// treated as that directory.
//
// All path arguments are resolved against the current directory first.
class ArchiveView {
  public:
    enum class Kind { Missing, File, Directory };

    static Result Open(const std::string& archive_path, ArchiveView& out);

    ArchiveView() = default;
    ArchiveView(const ArchiveView&) = delete;
    ArchiveView& operator=(const ArchiveView&) = delete;
    ArchiveView(ArchiveView&&) noexcept = default;
    ArchiveView& operator=(ArchiveView&&) noexcept = default;
    ~ArchiveView() = default;

    bool IsOpen() const { return archive_.IsOpen(); }
    void Close();

    const ArchiveHandle& Archive() const { return archive_; }

    // Canonical current directory: "" for the root, "dir/sub/" otherwise.
    const std::string& Cursor() const { return cwd_; }
    std::string Pwd() const;

    Result Resolve(std::string_view path, std::string& out) const;
    Kind Classify(std::string_view canonical) const;

    Result Exists(std::string_view path, bool& out) const;
    Result IsDirectory(std::string_view path, bool& out) const;
    Result IsFile(std::string_view path, bool& out) const;

    // Convenience forms: an unresolvable path is reported as absent.
    bool Exists(std::string_view path) const;
    bool IsDirectory(std::string_view path) const;
    bool IsFile(std::string_view path) const;

    // Children (or all descendants) of a directory, sorted, each prefixed
    // with the directory path; directory entries end in '/'.
    Result List(std::string_view path, bool recursive, std::vector<std::string>& out) const;

    Result ChangeDirectory(std::string_view path, std::string& out_pwd);
    // Adopts a canonical directory, e.g. one restored from saved state.
    Result SetCursor(std::string_view canonical);

    Result Read(std::string_view path, std::string& out) const;
    // encoding: "" or "binary" for raw bytes, "utf-8" or "ascii" to validate,
    // "latin-1" to transcode to UTF-8.
    Result ReadText(std::string_view path, std::string_view encoding, std::string& out) const;

    Result Info(std::string_view path, MemberInfo& out) const;

    // Every file member below `base` (recursively), sorted. Empty when `base`
    // does not resolve to a directory.
    std::vector<std::string> ScanAllFilesUnder(std::string_view base) const;

  private:
    bool HasPrefix(std::string_view prefix) const;
    Result ResolveFile(std::string_view path, std::string& rel) const;

    ArchiveHandle archive_;
    std::string cwd_;
};

} // namespace arcnav
