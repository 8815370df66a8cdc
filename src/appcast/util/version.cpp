#include "appcast/util/version.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>

namespace appcast {

namespace {

bool IsDigits(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool IsIdentifier(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-';
    });
}

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::expected<std::uint64_t, std::string> ParseNumber(std::string_view part) {
    if (!IsDigits(part))
        return std::unexpected("non-numeric version component '" + std::string(part) + "'");
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc{} || ptr != part.data() + part.size())
        return std::unexpected("version component out of range '" + std::string(part) + "'");
    return value;
}

int CompareIdentifiers(const std::string& lhs, const std::string& rhs) {
    const bool lhs_num = IsDigits(lhs);
    const bool rhs_num = IsDigits(rhs);
    if (lhs_num && rhs_num) {
        // Compare by length first so that arbitrarily long numerals never overflow.
        const auto l = lhs.find_first_not_of('0');
        const auto r = rhs.find_first_not_of('0');
        const std::string_view ls = l == std::string::npos ? std::string_view{} : std::string_view(lhs).substr(l);
        const std::string_view rs = r == std::string::npos ? std::string_view{} : std::string_view(rhs).substr(r);
        if (ls.size() != rs.size())
            return ls.size() < rs.size() ? -1 : 1;
        const int c = ls.compare(rs);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (lhs_num != rhs_num)
        return lhs_num ? -1 : 1;
    const int c = lhs.compare(rhs);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

std::expected<Version, std::string> Version::Parse(std::string_view text) {
    std::string_view s = Trim(text);
    if (s.empty())
        return std::unexpected("empty version string");
    if (s.front() == 'v' || s.front() == 'V')
        s.remove_prefix(1);

    Version v;

    if (const auto plus = s.find('+'); plus != std::string_view::npos) {
        const std::string_view build = s.substr(plus + 1);
        if (build.empty())
            return std::unexpected("empty build metadata in '" + std::string(text) + "'");
        for (auto&& rng : build | std::views::split('.')) {
            if (!IsIdentifier(std::string_view(rng)))
                return std::unexpected("invalid build metadata '" + std::string(build) + "'");
        }
        v.build = std::string(build);
        s = s.substr(0, plus);
    }

    if (const auto dash = s.find('-'); dash != std::string_view::npos) {
        const std::string_view pre = s.substr(dash + 1);
        if (pre.empty())
            return std::unexpected("empty prerelease in '" + std::string(text) + "'");
        for (auto&& rng : pre | std::views::split('.')) {
            const std::string_view id(rng);
            if (!IsIdentifier(id))
                return std::unexpected("invalid prerelease '" + std::string(pre) + "'");
            v.prerelease.emplace_back(id);
        }
        s = s.substr(0, dash);
    }

    std::uint64_t* fields[] = {&v.major, &v.minor, &v.patch};
    size_t count = 0;
    for (auto&& rng : s | std::views::split('.')) {
        if (count == 3)
            return std::unexpected("too many version components in '" + std::string(text) + "'");
        auto n = ParseNumber(std::string_view(rng));
        if (!n)
            return std::unexpected(n.error());
        *fields[count++] = *n;
    }
    if (count == 0)
        return std::unexpected("missing version number in '" + std::string(text) + "'");

    return v;
}

std::string Version::ToString() const {
    std::string out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (size_t i = 0; i < prerelease.size(); ++i) {
        out += (i == 0) ? "-" : ".";
        out += prerelease[i];
    }
    if (!build.empty())
        out += "+" + build;
    return out;
}

std::strong_ordering operator<=>(const Version& lhs, const Version& rhs) {
    if (auto c = lhs.major <=> rhs.major; c != 0) return c;
    if (auto c = lhs.minor <=> rhs.minor; c != 0) return c;
    if (auto c = lhs.patch <=> rhs.patch; c != 0) return c;

    // A release ranks above any of its prereleases.
    if (lhs.prerelease.empty() || rhs.prerelease.empty()) {
        return rhs.prerelease.size() == lhs.prerelease.size()
                   ? std::strong_ordering::equal
                   : (lhs.prerelease.empty() ? std::strong_ordering::greater
                                             : std::strong_ordering::less);
    }

    const size_t n = std::min(lhs.prerelease.size(), rhs.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        const int c = CompareIdentifiers(lhs.prerelease[i], rhs.prerelease[i]);
        if (c != 0)
            return c < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    return lhs.prerelease.size() <=> rhs.prerelease.size();
}

std::expected<int, std::string> VersionComparator::Compare(std::string_view lhs, std::string_view rhs) {
    auto l = Version::Parse(lhs);
    if (!l)
        return std::unexpected(l.error());
    auto r = Version::Parse(rhs);
    if (!r)
        return std::unexpected(r.error());

    const auto c = *l <=> *r;
    if (c == std::strong_ordering::less)
        return -1;
    if (c == std::strong_ordering::greater)
        return 1;
    return 0;
}

} // namespace appcast
