#include "appcast/feed/update_decider.hpp"

#include "appcast/feed/skipped_versions.hpp"
#include "appcast/util/logger.hpp"
#include "appcast/util/version.hpp"

namespace appcast {

const char* ToString(UpdateCheckOutcome outcome) {
    switch (outcome) {
        case UpdateCheckOutcome::NoUpdate:        return "NoUpdate";
        case UpdateCheckOutcome::UpdateAvailable: return "UpdateAvailable";
        case UpdateCheckOutcome::Forced:          return "Forced";
    }
    return "Unknown";
}

bool UpdateDecider::ShouldUpdate(const Feed& feed,
                                 const std::string& current_version,
                                 bool force_check) const {
    return Decide(feed, current_version, force_check) != UpdateCheckOutcome::NoUpdate;
}

UpdateCheckOutcome UpdateDecider::Decide(const Feed& feed,
                                         const std::string& current_version,
                                         bool force_check) const {
    auto cmp = VersionComparator::Compare(feed.version, current_version);
    if (!cmp) {
        LogWarn("Cannot compare feed version '%s' with current '%s': %s; treating as no update",
                feed.version.c_str(),
                current_version.c_str(),
                cmp.error().c_str());
        return UpdateCheckOutcome::NoUpdate;
    }

    if (force_check) {
        // A user-initiated check may re-offer the running version but never an older one.
        return *cmp >= 0 ? UpdateCheckOutcome::Forced : UpdateCheckOutcome::NoUpdate;
    }

    if (*cmp <= 0)
        return UpdateCheckOutcome::NoUpdate;

    if (skipped_ && skipped_->IsSkipped(feed.version)) {
        LogInfo("Version %s was skipped by the user", feed.version.c_str());
        return UpdateCheckOutcome::NoUpdate;
    }
    return UpdateCheckOutcome::UpdateAvailable;
}

} // namespace appcast
