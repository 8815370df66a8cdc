#pragma once

#include "appcast/feed/feed.hpp"

#include <string>

namespace appcast {

class ISkippedVersionStore;

enum class UpdateCheckOutcome {
    NoUpdate,
    UpdateAvailable,
    Forced,
};

const char* ToString(UpdateCheckOutcome outcome);

// Pure decision over (feed, current version, force). An unparsable version on
// either side is never an update.
class UpdateDecider {
public:
    UpdateDecider() = default;
    explicit UpdateDecider(const ISkippedVersionStore* skipped) : skipped_(skipped) {}

    bool ShouldUpdate(const Feed& feed, const std::string& current_version, bool force_check) const;

    UpdateCheckOutcome Decide(const Feed& feed,
                              const std::string& current_version,
                              bool force_check) const;

private:
    const ISkippedVersionStore* skipped_ = nullptr;
};

} // namespace appcast
