#pragma once

#include "appcast/update/host.hpp"
#include "appcast/update/progress_sinks.hpp"

#include <cstdio>
#include <optional>
#include <string>

namespace appcast {

// Terminal host for appcast-check: prompts on stdin unless assume_yes is set
// and prints the verified artifact path on stdout.
class ConsoleUpdateHost final : public IUpdateHost {
public:
    explicit ConsoleUpdateHost(bool assume_yes, std::FILE* in = stdin, std::FILE* out = stdout);

    void ShowDiagnostics() override;
    UpdateChoice OfferUpdate(const Feed& feed, const std::string& current_version) override;
    void ShowNoUpdates(const std::string& current_version) override;
    IProgress* DownloadProgress() override { return &progress_; }
    void ReportDownloadFailed(const Feed& feed, const std::string& reason) override;
    bool ConfirmInstallation(const Feed& feed, const std::string& artifact_path) override;
    void ReportVerificationFailed(const Feed& feed) override;
    void LaunchArtifact(const std::string& artifact_path) override;

    bool rejected() const { return rejected_; }
    bool download_failed() const { return download_failed_; }
    const std::optional<std::string>& ready_path() const { return ready_path_; }

private:
    // Reads one answer line; returns the first non-blank character lowered, or '\0'.
    char Ask(const std::string& prompt);

    bool assume_yes_;
    std::FILE* in_;
    std::FILE* out_;
    ConsoleProgressSink progress_;

    bool rejected_ = false;
    bool download_failed_ = false;
    std::optional<std::string> ready_path_;
};

} // namespace appcast
