#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace appcast {

// Semantic version: major.minor.patch[-prerelease][+build].
// Build metadata is kept for display but never takes part in ordering.
struct Version {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> prerelease;
    std::string build;

    static std::expected<Version, std::string> Parse(std::string_view text);

    std::string ToString() const;

    friend std::strong_ordering operator<=>(const Version& lhs, const Version& rhs);
    friend bool operator==(const Version& lhs, const Version& rhs) {
        return (lhs <=> rhs) == std::strong_ordering::equal;
    }
};

class VersionComparator {
public:
    // Returns -1, 0 or 1. Fails if either side is not a valid version.
    static std::expected<int, std::string> Compare(std::string_view lhs, std::string_view rhs);
};

} // namespace appcast
