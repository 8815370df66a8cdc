#include "appcast/feed/skipped_versions.hpp"
#include "appcast/net/curl_fetcher.hpp"
#include "appcast/system/signals.hpp"
#include "appcast/update/console_host.hpp"
#include "appcast/update/updater.hpp"
#include "appcast/util/config.hpp"
#include "appcast/util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitUsage = 2;
constexpr int kExitRejected = 3;
constexpr int kExitDownloadFailed = 4;
constexpr int kExitCheckFailed = 5;
constexpr int kExitCancelled = 130;

// curl takes timeouts as long.
std::chrono::seconds TimeoutSeconds(std::uint64_t v) {
    return std::chrono::seconds(static_cast<long>(std::min<std::uint64_t>(v, LONG_MAX)));
}

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-u <feed-url>] [-f] [-d] [-y] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config        Configuration file (default %s)\n"
        "  -u, --feed-url      Check this feed instead of the configured one\n"
        "  -f, --force         User-initiated check: always report a result\n"
        "  -d, --diagnostics   Show diagnostics output\n"
        "  -y, --yes           Answer yes to every prompt\n"
        "  -v, --verbose       Debug logging\n"
        "  -h, --help          Show this help\n",
        argv, appcast::config::kDefaultConfigPath);
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = appcast::config::kDefaultConfigPath;
    std::optional<std::string> feed_url;
    bool force = false;
    bool diagnostics = false;
    bool assume_yes = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"feed-url", required_argument, nullptr, 'u'},
        {"force", no_argument, nullptr, 'f'},
        {"diagnostics", no_argument, nullptr, 'd'},
        {"yes", no_argument, nullptr, 'y'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:u:fdyv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'c':
                config_path = optarg;
                break;
            case 'u':
                feed_url = optarg;
                break;
            case 'f':
                force = true;
                break;
            case 'd':
                diagnostics = true;
                break;
            case 'y':
                assume_yes = true;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    appcast::config::UpdaterConfigFromFile cfg;
    if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return kExitConfig;
    }

    if (verbose) {
        appcast::Logger::Instance().SetLevel(appcast::LogLevel::Debug);
    } else if (cfg.log_level) {
        appcast::Logger::Instance().SetLevel(*cfg.log_level);
    }

    if (cfg.identity.public_key_path.empty()) {
        LogWarn("No public_key_path configured: signed artifacts cannot be verified");
    }

    appcast::CurlContentFetcher::Options fetch_opt;
    if (cfg.fetch_timeout_seconds)
        fetch_opt.timeout = TimeoutSeconds(*cfg.fetch_timeout_seconds);
    if (cfg.connect_timeout_seconds)
        fetch_opt.connect_timeout = TimeoutSeconds(*cfg.connect_timeout_seconds);
    if (!cfg.user_agent.empty())
        fetch_opt.user_agent = cfg.user_agent;
    auto fetcher = std::make_shared<appcast::CurlContentFetcher>(fetch_opt);

    std::unique_ptr<appcast::ISkippedVersionStore> skipped;
    if (!cfg.skipped_versions_path.empty())
        skipped = std::make_unique<appcast::JsonFileSkippedVersionStore>(cfg.skipped_versions_path);

    appcast::CancelToken interrupted;
    appcast::InstallSignalHandlers(interrupted);

    appcast::ConsoleUpdateHost host(assume_yes);
    appcast::Updater::Collaborators collaborators;
    collaborators.skipped_versions = skipped.get();
    appcast::Updater::Options options;
    options.temp_dir = cfg.temp_dir;

    appcast::Updater updater(cfg.identity, fetcher, host, collaborators, options);

    const bool started = force ? updater.ForceCheckInBackground(feed_url, diagnostics)
                               : updater.CheckInBackground(feed_url, diagnostics);
    if (!started) {
        std::fprintf(stderr, "ERROR: update check could not be started\n");
        return kExitCheckFailed;
    }

    while (updater.IsChecking()) {
        if (interrupted.IsCancelled())
            updater.Cancel();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    updater.WaitIdle();

    if (host.rejected())
        return kExitRejected;
    if (host.download_failed())
        return kExitDownloadFailed;

    const auto report = updater.LastReport();
    if (!report)
        return kExitCheckFailed;
    if (report->error) {
        if (report->error->kind == appcast::CheckError::Kind::Cancelled)
            return kExitCancelled;
        std::fprintf(stderr, "ERROR: %s\n", report->error->message.c_str());
        return kExitCheckFailed;
    }
    return kExitOk;
}
