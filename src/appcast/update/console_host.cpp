#include "appcast/update/console_host.hpp"

#include <cctype>

namespace appcast {

ConsoleUpdateHost::ConsoleUpdateHost(bool assume_yes, std::FILE* in, std::FILE* out)
    : assume_yes_(assume_yes), in_(in), out_(out) {}

char ConsoleUpdateHost::Ask(const std::string& prompt) {
    ClearProgressLine();
    std::fprintf(stderr, "%s ", prompt.c_str());
    std::fflush(stderr);

    char line[128]{};
    if (!std::fgets(line, sizeof(line), in_))
        return '\0';
    for (const char* p = line; *p; ++p) {
        if (!std::isspace(static_cast<unsigned char>(*p)))
            return static_cast<char>(std::tolower(static_cast<unsigned char>(*p)));
    }
    return '\0';
}

void ConsoleUpdateHost::ShowDiagnostics() {
    Logger::Instance().SetLevel(LogLevel::Debug);
}

UpdateChoice ConsoleUpdateHost::OfferUpdate(const Feed& feed, const std::string& current_version) {
    std::fprintf(stderr, "A new version is available: %s (you have %s)\n",
                 feed.version.c_str(), current_version.c_str());
    if (!feed.title.empty())
        std::fprintf(stderr, "  %s\n", feed.title.c_str());
    if (!feed.release_notes_url.empty())
        std::fprintf(stderr, "  Release notes: %s\n", feed.release_notes_url.c_str());

    if (assume_yes_)
        return UpdateChoice::Download;

    switch (Ask("Download now? [y]es / [n]ot now / [s]kip this version:")) {
        case 'y': return UpdateChoice::Download;
        case 's': return UpdateChoice::SkipVersion;
        default:  return UpdateChoice::RemindLater;
    }
}

void ConsoleUpdateHost::ShowNoUpdates(const std::string& current_version) {
    std::fprintf(stderr, "You are running the latest version (%s).\n", current_version.c_str());
}

void ConsoleUpdateHost::ReportDownloadFailed(const Feed& feed, const std::string& reason) {
    download_failed_ = true;
    ClearProgressLine();
    std::fprintf(stderr, "Downloading version %s failed: %s\n", feed.version.c_str(), reason.c_str());
}

bool ConsoleUpdateHost::ConfirmInstallation(const Feed& feed, const std::string&) {
    if (assume_yes_)
        return true;
    return Ask("Version " + feed.version + " downloaded. Continue with installation? [y/N]") == 'y';
}

void ConsoleUpdateHost::ReportVerificationFailed(const Feed& feed) {
    rejected_ = true;
    std::fprintf(stderr,
                 "The downloaded installer for version %s failed signature verification and was deleted.\n",
                 feed.version.c_str());
}

void ConsoleUpdateHost::LaunchArtifact(const std::string& artifact_path) {
    ready_path_ = artifact_path;
    std::fprintf(out_, "%s\n", artifact_path.c_str());
    std::fflush(out_);
}

} // namespace appcast
