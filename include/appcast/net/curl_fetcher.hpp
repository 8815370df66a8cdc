#pragma once

#include "appcast/net/content_fetcher.hpp"

#include <chrono>
#include <string>

namespace appcast {

class CurlContentFetcher final : public IContentFetcher {
public:
    struct Options {
        std::chrono::seconds timeout{60};
        std::chrono::seconds connect_timeout{15};
        std::string user_agent = "appcast-updater/1.0";
        long max_redirects = 8;
    };

    CurlContentFetcher();
    explicit CurlContentFetcher(Options options);

    std::future<FetchResult<std::string>> FetchText(const std::string& url,
                                                    const CancelToken& cancel) override;

    std::future<FetchResult<std::uint64_t>> FetchBinary(const std::string& url,
                                                        const std::string& destination_path,
                                                        IProgress* progress,
                                                        const CancelToken& cancel) override;

    // Blocking variants used by the async wrappers.
    FetchResult<std::string> FetchTextNow(const std::string& url, const CancelToken& cancel) const;
    FetchResult<std::uint64_t> FetchBinaryNow(const std::string& url,
                                              const std::string& destination_path,
                                              IProgress* progress,
                                              const CancelToken& cancel) const;

private:
    Options options_;
};

} // namespace appcast
