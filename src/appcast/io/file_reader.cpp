#include "appcast/io/file_reader.hpp"

#include <array>
#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

namespace appcast {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    out.fd_ = Fd::OpenReadOnly(out.path_);
    if (!out.fd_.Valid())
        return Result::FromErrno("Failed to open: " + out.path_);

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) != 0) {
        return Result::FromErrno("fstat failed: " + out.path_);
    }
    if (!S_ISREG(st.st_mode)) {
        out.fd_.Close();
        return Result::Fail(EINVAL, "Not a regular file: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadFileToBytes(const std::string& path, std::string& out) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok())
        return r;

    out.clear();
    if (auto size = reader.TotalSize())
        out.reserve(static_cast<size_t>(*size));

    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0)
            return Result::Fail(errno, "read failed: " + path);
        if (n == 0)
            break;
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace appcast
