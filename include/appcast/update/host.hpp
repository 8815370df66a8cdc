#pragma once

#include "appcast/feed/feed.hpp"
#include "appcast/io/progress.hpp"
#include "appcast/util/logger.hpp"

#include <string>

namespace appcast {

enum class UpdateChoice {
    Download,
    RemindLater,
    SkipVersion,
};

// The embedding application's side of a check: dialogs, notices and the
// process launch of a verified artifact. Called on the check's task.
class IUpdateHost {
public:
    virtual ~IUpdateHost() = default;

    virtual void ShowDiagnostics() {}

    virtual UpdateChoice OfferUpdate(const Feed& feed, const std::string& current_version) = 0;
    virtual void ShowNoUpdates(const std::string& current_version) = 0;

    virtual IProgress* DownloadProgress() { return nullptr; }
    virtual void ReportDownloadFailed(const Feed& feed, const std::string& reason) = 0;

    // Asked once the artifact is on disk; false abandons the installation.
    virtual bool ConfirmInstallation(const Feed& feed, const std::string& artifact_path) = 0;

    virtual void ReportVerificationFailed(const Feed& feed) = 0;

    // The artifact at `artifact_path` passed the trust gate and now belongs to the host.
    virtual void LaunchArtifact(const std::string& artifact_path) = 0;
};

// Per-updater diagnostics log, shown by hosts in their debugging view.
class IDiagnosticsLog {
public:
    virtual ~IDiagnosticsLog() = default;
    virtual void Log(LogLevel level, const std::string& line) = 0;
};

class LoggerDiagnosticsLog final : public IDiagnosticsLog {
public:
    void Log(LogLevel level, const std::string& line) override {
        Logger::Instance().Log(level, "%s", line.c_str());
    }
};

class IAnalyticsLogger {
public:
    virtual ~IAnalyticsLogger() = default;
    virtual void OnUpdateOffered(const Feed&) {}
    virtual void OnDownloadNow() {}
    virtual void OnRemindLater() {}
    virtual void OnSkipVersion(const std::string&) {}
    virtual void OnContinueWithInstallation() {}
    virtual void OnInstallationCancelled() {}
    virtual void OnSignatureRejected(const Feed&) {}
};

class NullAnalyticsLogger final : public IAnalyticsLogger {};

} // namespace appcast
