#pragma once

#include "appcast/feed/feed.hpp"
#include "appcast/feed/feed_parser.hpp"
#include "appcast/feed/update_decider.hpp"
#include "appcast/net/content_fetcher.hpp"
#include "appcast/trust/signature_verifier.hpp"
#include "appcast/update/event_channel.hpp"
#include "appcast/update/host.hpp"
#include "appcast/util/cancel.hpp"
#include "appcast/util/config.hpp"

#include <atomic>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace appcast {

class ISkippedVersionStore;
class DownloadSession;

enum class CheckState {
    Idle,
    Fetching,
    Parsed,
    Deciding,
    NoUpdateReported,
    UpdateOffered,
    Downloading,
    TrustGating,
    Ready,
    Rejected,
};

const char* ToString(CheckState state);

struct CheckError {
    enum class Kind {
        Fetch,
        Parse,
        Download,
        Io,
        Cancelled,
        Aborted,  // a host or collaborator callback threw
    };

    Kind kind = Kind::Fetch;
    std::string message;
};

const char* ToString(CheckError::Kind kind);

// Summary of one check cycle. final_state is the last state entered before
// returning to Idle.
struct CheckReport {
    CheckState final_state = CheckState::Idle;
    std::optional<Feed> feed;
    std::optional<UpdateCheckOutcome> outcome;
    std::optional<UpdateChoice> choice;
    std::optional<TrustVerdict> verdict;
    std::string artifact_path;
    std::optional<CheckError> error;
};

// Drives fetch -> parse -> decide -> download -> trust gate -> hand-off.
// At most one check runs at a time; requests made while one is in flight are
// ignored.
class Updater {
public:
    struct Collaborators {
        IDiagnosticsLog* diagnostics = nullptr;   // defaults to the process Logger
        IAnalyticsLogger* analytics = nullptr;    // defaults to no-op
        ISkippedVersionStore* skipped_versions = nullptr;
    };

    struct Options {
        std::string temp_dir;  // empty => system temp directory
    };

    Updater(AppIdentity identity, std::shared_ptr<IContentFetcher> fetcher, IUpdateHost& host);
    Updater(AppIdentity identity,
            std::shared_ptr<IContentFetcher> fetcher,
            IUpdateHost& host,
            Collaborators collaborators,
            Options options = {});

    Updater(const Updater&) = delete;
    Updater& operator=(const Updater&) = delete;

    // Cancels and joins any check in flight.
    ~Updater();

    // Fire-and-forget entry points. Return false when a check is already running.
    bool CheckInBackground(std::optional<std::string> feed_url = std::nullopt,
                           bool show_diagnostics = false);
    bool ForceCheckInBackground(std::optional<std::string> feed_url = std::nullopt,
                                bool show_diagnostics = false);

    // Runs one check on the calling thread. nullopt when another check is running.
    std::optional<CheckReport> RunCheck(std::optional<std::string> feed_url,
                                        bool force_check,
                                        bool show_diagnostics = false);

    void Cancel();
    void WaitIdle();

    bool IsChecking() const { return busy_.load(); }
    CheckState State() const { return state_.load(); }
    std::optional<CheckReport> LastReport() const;

    const AppIdentity& Identity() const { return identity_; }

    EventChannel<Feed>& FeedAvailable() { return feed_available_; }
    EventChannel<std::string>& ArtifactDownloaded() { return artifact_downloaded_; }
    EventChannel<CheckState>& StateChanged() { return state_changed_; }

private:
    struct Decision {
        Feed feed;
        UpdateCheckOutcome outcome = UpdateCheckOutcome::NoUpdate;
    };

    bool StartBackground(std::optional<std::string> feed_url, bool force_check, bool show_diagnostics);
    CheckReport ExecuteCheck(const std::string& feed_url, bool force_check, bool show_diagnostics);
    void RunStages(const std::string& feed_url, bool force_check, bool show_diagnostics, CheckReport& report);
    std::expected<Decision, CheckError> FetchAndDecide(const std::string& feed_url,
                                                       bool force_check,
                                                       CheckReport& report);
    void HandleOffer(const Feed& feed, CheckReport& report);
    void DownloadAndVerify(const Feed& feed, CheckReport& report);
    void GateAndHandOff(const Feed& feed, DownloadSession& session, CheckReport& report);

    void Enter(CheckState state, CheckReport& report);
    void SetState(CheckState state);
    void Diag(LogLevel level, const std::string& line);

    AppIdentity identity_;
    std::shared_ptr<IContentFetcher> fetcher_;
    IUpdateHost& host_;

    LoggerDiagnosticsLog default_diagnostics_;
    NullAnalyticsLogger default_analytics_;
    IDiagnosticsLog* diagnostics_;
    IAnalyticsLogger* analytics_;
    ISkippedVersionStore* skipped_versions_;
    Options options_;

    FeedParser parser_;
    SignatureVerifier verifier_;

    EventChannel<Feed> feed_available_;
    EventChannel<std::string> artifact_downloaded_;
    EventChannel<CheckState> state_changed_;

    CancelToken cancel_;
    std::atomic_bool busy_{false};
    std::atomic<CheckState> state_{CheckState::Idle};

    std::mutex worker_mu_;
    std::future<void> worker_;

    mutable std::mutex report_mu_;
    std::optional<CheckReport> last_report_;
};

} // namespace appcast
