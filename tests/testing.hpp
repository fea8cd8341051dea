#pragma once

#include "io/io.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/arcnav_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

struct ZipEntry {
    std::string path;
    std::string contents;
    bool store = false;
    bool directory = false;
};

// Writes a real ZIP archive with libarchive's writer. Entries with `store`
// set are written uncompressed, the rest are deflated. `directory` entries
// become explicit directory records.
inline void BuildZip(const std::string& dest, const std::vector<ZipEntry>& entries) {
    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format_zip failed");
    }
    if (archive_write_open_filename(a, dest.c_str()) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_filename failed: " + dest);
    }

    for (const auto& entry : entries) {
        const int rc = entry.store ? archive_write_zip_set_compression_store(a)
                                   : archive_write_zip_set_compression_deflate(a);
        if (rc != ARCHIVE_OK) {
            (void)archive_write_free(a);
            throw std::runtime_error("cannot select zip compression");
        }

        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.directory ? AE_IFDIR : AE_IFREG);
        archive_entry_set_perm(hdr, entry.directory ? 0755 : 0644);
        archive_entry_set_mtime(hdr, 1700000000, 0);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed: " + entry.path);
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::string& path, const std::string& data) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    os << data;
    if (!os.good())
        throw std::runtime_error("cannot write " + path);
}

// Flips one bit of the first occurrence of `needle` in the file. Used to
// corrupt the payload of a stored member without touching the headers.
inline void FlipFirstOccurrence(const std::string& path, const std::string& needle) {
    std::string data = ReadFile(path);
    const auto pos = data.find(needle);
    if (pos == std::string::npos)
        throw std::runtime_error("pattern not found in " + path);
    data[pos] = static_cast<char>(data[pos] ^ 0x01);
    WriteFile(path, data);
}

inline std::string ReadAll(arcnav::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

} // namespace testutil
