#include "io/file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace arcnav {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);
    return Fd::Open(out.path_, O_WRONLY | O_CREAT | O_TRUNC, 0644, out.fd_);
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = errno;
        return Result::Fail(ErrorCode::IoError, err,
                            "write failed: " + path_ + " (" + std::strerror(err) + ")");
    }

    return Result::Ok();
}

Result FileWriter::Write(std::string_view text) {
    return WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int err = errno;
        return Result::Fail(ErrorCode::IoError, err,
                            "fsync failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

void FileWriter::Close() { fd_.Close(); }

Result WriteFileAtomically(const std::string& path, std::string_view contents) {
    const std::string tmp = path + ".tmp";

    FileWriter w;
    if (auto r = FileWriter::Open(tmp, w); !r.is_ok()) return r;
    if (auto r = w.Write(contents); !r.is_ok()) return r;
    if (auto r = w.FsyncNow(); !r.is_ok()) return r;
    w.Close();

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        (void)::unlink(tmp.c_str());
        return Result::Fail(ErrorCode::IoError, err,
                            "rename " + tmp + " -> " + path + " failed (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

} // namespace arcnav
