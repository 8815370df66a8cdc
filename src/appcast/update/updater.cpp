#include "appcast/update/updater.hpp"

#include "appcast/feed/skipped_versions.hpp"
#include "appcast/update/download_session.hpp"

#include <exception>
#include <utility>

namespace appcast {

namespace {

// Collects a fetch future. The fetch task owns the transfer and honours the
// cancel token itself; an exception escaping a fetcher is folded into
// FetchError so it stays inside the check's failure boundary.
template <typename T>
FetchResult<T> Await(std::future<FetchResult<T>> pending) {
    if (!pending.valid())
        return std::unexpected(FetchError::Make(FetchError::Kind::Network, "fetcher returned no result"));
    try {
        return pending.get();
    } catch (const std::exception& e) {
        return std::unexpected(
            FetchError::Make(FetchError::Kind::Network, std::string("fetcher failed: ") + e.what()));
    }
}

// Clears the in-flight flag when a check leaves ExecuteCheck by any path.
class BusyRelease final {
public:
    explicit BusyRelease(std::atomic_bool& flag) : flag_(flag) {}
    BusyRelease(const BusyRelease&) = delete;
    BusyRelease& operator=(const BusyRelease&) = delete;
    ~BusyRelease() { flag_.store(false); }

private:
    std::atomic_bool& flag_;
};

} // namespace

const char* ToString(CheckState state) {
    switch (state) {
        case CheckState::Idle:             return "Idle";
        case CheckState::Fetching:         return "Fetching";
        case CheckState::Parsed:           return "Parsed";
        case CheckState::Deciding:         return "Deciding";
        case CheckState::NoUpdateReported: return "NoUpdateReported";
        case CheckState::UpdateOffered:    return "UpdateOffered";
        case CheckState::Downloading:      return "Downloading";
        case CheckState::TrustGating:      return "TrustGating";
        case CheckState::Ready:            return "Ready";
        case CheckState::Rejected:         return "Rejected";
    }
    return "Unknown";
}

const char* ToString(CheckError::Kind kind) {
    switch (kind) {
        case CheckError::Kind::Fetch:     return "fetch";
        case CheckError::Kind::Parse:     return "parse";
        case CheckError::Kind::Download:  return "download";
        case CheckError::Kind::Io:        return "io";
        case CheckError::Kind::Cancelled: return "cancelled";
        case CheckError::Kind::Aborted:   return "aborted";
    }
    return "unknown";
}

Updater::Updater(AppIdentity identity, std::shared_ptr<IContentFetcher> fetcher, IUpdateHost& host)
    : Updater(std::move(identity), std::move(fetcher), host, Collaborators{}) {}

Updater::Updater(AppIdentity identity,
                 std::shared_ptr<IContentFetcher> fetcher,
                 IUpdateHost& host,
                 Collaborators collaborators,
                 Options options)
    : identity_(std::move(identity)),
      fetcher_(std::move(fetcher)),
      host_(host),
      diagnostics_(collaborators.diagnostics ? collaborators.diagnostics : &default_diagnostics_),
      analytics_(collaborators.analytics ? collaborators.analytics : &default_analytics_),
      skipped_versions_(collaborators.skipped_versions),
      options_(std::move(options)) {}

Updater::~Updater() {
    Cancel();
    WaitIdle();
}

bool Updater::CheckInBackground(std::optional<std::string> feed_url, bool show_diagnostics) {
    return StartBackground(std::move(feed_url), false, show_diagnostics);
}

bool Updater::ForceCheckInBackground(std::optional<std::string> feed_url, bool show_diagnostics) {
    return StartBackground(std::move(feed_url), true, show_diagnostics);
}

bool Updater::StartBackground(std::optional<std::string> feed_url,
                              bool force_check,
                              bool show_diagnostics) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        Diag(LogLevel::Info, "A check is already in progress; request ignored");
        return false;
    }

    std::lock_guard<std::mutex> lk(worker_mu_);
    if (worker_.valid())
        worker_.wait();
    cancel_.Reset();

    const std::string url = feed_url.value_or(identity_.feed_url);
    worker_ = std::async(std::launch::async, [this, url, force_check, show_diagnostics] {
        (void)ExecuteCheck(url, force_check, show_diagnostics);
    });
    return true;
}

std::optional<CheckReport> Updater::RunCheck(std::optional<std::string> feed_url,
                                             bool force_check,
                                             bool show_diagnostics) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        Diag(LogLevel::Info, "A check is already in progress; request ignored");
        return std::nullopt;
    }
    cancel_.Reset();
    return ExecuteCheck(feed_url.value_or(identity_.feed_url), force_check, show_diagnostics);
}

void Updater::Cancel() { cancel_.Cancel(); }

void Updater::WaitIdle() {
    std::lock_guard<std::mutex> lk(worker_mu_);
    if (worker_.valid())
        worker_.wait();
}

std::optional<CheckReport> Updater::LastReport() const {
    std::lock_guard<std::mutex> lk(report_mu_);
    return last_report_;
}

CheckReport Updater::ExecuteCheck(const std::string& feed_url, bool force_check, bool show_diagnostics) {
    BusyRelease release(busy_);

    CheckReport report;
    try {
        RunStages(feed_url, force_check, show_diagnostics, report);
    } catch (const std::exception& e) {
        report.error = CheckError{CheckError::Kind::Aborted, e.what()};
    } catch (...) {
        report.error = CheckError{CheckError::Kind::Aborted, "non-standard exception"};
    }
    if (report.error && report.error->kind == CheckError::Kind::Aborted)
        Diag(LogLevel::Error, "Update check aborted: " + report.error->message);

    SetState(CheckState::Idle);
    {
        std::lock_guard<std::mutex> lk(report_mu_);
        last_report_ = report;
    }
    return report;
}

void Updater::RunStages(const std::string& feed_url,
                        bool force_check,
                        bool show_diagnostics,
                        CheckReport& report) {
    if (show_diagnostics)
        host_.ShowDiagnostics();

    Diag(LogLevel::Info, "Starting fetching remote feed content from address: " + feed_url);
    auto decision = FetchAndDecide(feed_url, force_check, report);
    Diag(LogLevel::Info, "Finished fetching remote feed content");

    if (!decision) {
        Diag(decision.error().kind == CheckError::Kind::Cancelled ? LogLevel::Info : LogLevel::Error,
             std::string("Update check failed (") + ToString(decision.error().kind) + "): " +
                 decision.error().message);
        report.error = decision.error();
    } else {
        report.feed = decision->feed;
        report.outcome = decision->outcome;

        if (decision->outcome == UpdateCheckOutcome::NoUpdate) {
            Diag(LogLevel::Info, "No update available (current " + identity_.current_version +
                                     ", feed " + decision->feed.version + ")");
            if (force_check) {
                Enter(CheckState::NoUpdateReported, report);
                host_.ShowNoUpdates(identity_.current_version);
            }
        } else {
            HandleOffer(decision->feed, report);
        }
    }
}

std::expected<Updater::Decision, CheckError> Updater::FetchAndDecide(const std::string& feed_url,
                                                                     bool force_check,
                                                                     CheckReport& report) {
    if (!fetcher_)
        return std::unexpected(CheckError{CheckError::Kind::Fetch, "no content fetcher configured"});

    Enter(CheckState::Fetching, report);
    auto text = Await(fetcher_->FetchText(feed_url, cancel_));
    if (cancel_.IsCancelled())
        return std::unexpected(CheckError{CheckError::Kind::Cancelled, "check cancelled"});
    if (!text) {
        return std::unexpected(CheckError{
            CheckError::Kind::Fetch,
            std::string(ToString(text.error().kind)) + ": " + text.error().message});
    }

    Diag(LogLevel::Debug, "Started deserializing remote feed content");
    auto feed = parser_.Parse(*text);
    if (!feed)
        return std::unexpected(CheckError{CheckError::Kind::Parse, "Error parsing remote feed: " + feed.error()});
    Diag(LogLevel::Debug, "Finished deserializing remote feed content");

    Enter(CheckState::Parsed, report);
    feed_available_.Publish(*feed);

    Enter(CheckState::Deciding, report);
    const UpdateDecider decider(skipped_versions_);
    const UpdateCheckOutcome outcome = decider.Decide(*feed, identity_.current_version, force_check);
    Diag(LogLevel::Debug, std::string("Decision: ") + ToString(outcome));

    return Decision{.feed = std::move(*feed), .outcome = outcome};
}

void Updater::HandleOffer(const Feed& feed, CheckReport& report) {
    Enter(CheckState::UpdateOffered, report);
    analytics_->OnUpdateOffered(feed);
    Diag(LogLevel::Info, "Offering version " + feed.version + " (current " + identity_.current_version + ")");

    const UpdateChoice choice = host_.OfferUpdate(feed, identity_.current_version);
    report.choice = choice;

    switch (choice) {
        case UpdateChoice::Download:
            analytics_->OnDownloadNow();
            Diag(LogLevel::Info, "Continuing with downloading the artifact");
            DownloadAndVerify(feed, report);
            return;
        case UpdateChoice::RemindLater:
            analytics_->OnRemindLater();
            Diag(LogLevel::Info, "Update postponed by the user");
            return;
        case UpdateChoice::SkipVersion:
            analytics_->OnSkipVersion(feed.version);
            if (!skipped_versions_) {
                Diag(LogLevel::Warn, "No skipped-version store configured; skip not remembered");
                return;
            }
            if (auto r = skipped_versions_->Skip(feed.version); !r.is_ok()) {
                Diag(LogLevel::Warn, "Cannot remember skipped version: " + r.message());
                return;
            }
            Diag(LogLevel::Info, "Version " + feed.version + " will be skipped");
            return;
    }
}

void Updater::DownloadAndVerify(const Feed& feed, CheckReport& report) {
    auto session = DownloadSession::Create(feed.artifact_url, options_.temp_dir);
    if (!session) {
        report.error = CheckError{CheckError::Kind::Io, session.error()};
        Diag(LogLevel::Error, "Cannot prepare download: " + session.error());
        host_.ReportDownloadFailed(feed, session.error());
        return;
    }

    Enter(CheckState::Downloading, report);
    Diag(LogLevel::Info, "Downloading " + feed.artifact_url + " to " + session->Path());
    auto bytes = Await(fetcher_->FetchBinary(feed.artifact_url, session->Path(), host_.DownloadProgress(), cancel_));

    if (cancel_.IsCancelled() || (!bytes && bytes.error().kind == FetchError::Kind::Cancelled)) {
        session->MarkFailed();
        report.error = CheckError{CheckError::Kind::Cancelled, "download cancelled"};
        Diag(LogLevel::Info, "Download cancelled");
        return;
    }
    if (!bytes) {
        session->MarkFailed();
        const std::string reason = std::string(ToString(bytes.error().kind)) + ": " + bytes.error().message;
        report.error = CheckError{CheckError::Kind::Download, reason};
        Diag(LogLevel::Error, "Artifact download failed: " + reason);
        host_.ReportDownloadFailed(feed, reason);
        return;
    }

    session->MarkCompleted();
    Diag(LogLevel::Info, "Downloaded " + std::to_string(*bytes) + " bytes to " + session->Path());
    artifact_downloaded_.Publish(session->Path());

    if (!host_.ConfirmInstallation(feed, session->Path())) {
        analytics_->OnInstallationCancelled();
        Diag(LogLevel::Info, "Installation cancelled; removing downloaded artifact");
        if (auto r = session->Discard(); !r.is_ok())
            Diag(LogLevel::Warn, r.message());
        return;
    }
    analytics_->OnContinueWithInstallation();
    Diag(LogLevel::Info, "Continue after downloading artifact");

    if (cancel_.IsCancelled()) {
        report.error = CheckError{CheckError::Kind::Cancelled, "check cancelled before verification"};
        return;
    }

    GateAndHandOff(feed, *session, report);
}

void Updater::GateAndHandOff(const Feed& feed, DownloadSession& session, CheckReport& report) {
    Enter(CheckState::TrustGating, report);
    if (feed.HasSignature())
        Diag(LogLevel::Info, "Signature provided. Verifying artifact's signature");

    const TrustVerdict verdict = verifier_.Verify(feed.signature, session.Path(), identity_.public_key_path);
    report.verdict = verdict;

    switch (verdict) {
        case TrustVerdict::NoSignaturePresent:
            Diag(LogLevel::Warn,
                 "No signature provided for " + feed.artifact_url +
                     ". Skipping signature verification; the artifact is not authenticated");
            break;
        case TrustVerdict::Verified:
            Diag(LogLevel::Info, "Successfully verified artifact's signature");
            break;
        case TrustVerdict::VerificationFailed: {
            Diag(LogLevel::Error, "Couldn't verify artifact's signature. The artifact will now be deleted.");
            if (auto r = session.Discard(); !r.is_ok())
                Diag(LogLevel::Error, r.message());
            Enter(CheckState::Rejected, report);
            analytics_->OnSignatureRejected(feed);
            host_.ReportVerificationFailed(feed);
            return;
        }
    }

    Enter(CheckState::Ready, report);
    report.artifact_path = session.Release();
    host_.LaunchArtifact(report.artifact_path);
    Diag(LogLevel::Info, "Handed artifact over for execution: " + report.artifact_path);
}

void Updater::Enter(CheckState state, CheckReport& report) {
    report.final_state = state;
    SetState(state);
}

void Updater::SetState(CheckState state) {
    const CheckState prev = state_.exchange(state);
    if (prev == state)
        return;
    Diag(LogLevel::Debug, std::string("State ") + ToString(prev) + " -> " + ToString(state));
    state_changed_.Publish(state);
}

void Updater::Diag(LogLevel level, const std::string& line) {
    diagnostics_->Log(level, line);
}

} // namespace appcast
