#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <string_view>

namespace arcnav {

// Writes a regular file from scratch (O_CREAT | O_TRUNC).
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    Result Write(std::string_view text);
    void Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

// Writes `contents` to `path + ".tmp"`, fsyncs it and renames it over `path`.
// Readers observe either the previous file or the complete new one.
Result WriteFileAtomically(const std::string& path, std::string_view contents);

} // namespace arcnav
