#pragma once

#include "appcast/io/fd.hpp"
#include "appcast/io/io.hpp"
#include "appcast/util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace appcast {

// Read-only view over a regular file. Never writes or truncates.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Reads the whole file into memory.
Result ReadFileToBytes(const std::string& path, std::string& out);

} // namespace appcast
