#pragma once

#include "appcast/feed/feed.hpp"

#include <expected>
#include <string>

namespace appcast {

class FeedParser {
  public:
    // Builds the typed fields and, from a second independent parse of the same
    // payload, the extension mapping.
    std::expected<Feed, std::string> Parse(const std::string& raw) const;
};

} // namespace appcast
