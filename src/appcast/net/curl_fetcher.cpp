#include "appcast/net/curl_fetcher.hpp"

#include "appcast/util/logger.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>

namespace appcast {

namespace {

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LogError("curl_global_init failed: %s", curl_easy_strerror(rc));
        }
    });
}

class CurlHandle final {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    ~CurlHandle() {
        if (curl_) curl_easy_cleanup(curl_);
    }

    CURL* get() const { return curl_; }
    bool ok() const { return curl_ != nullptr; }

private:
    CURL* curl_ = nullptr;
};

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

struct TransferContext {
    const CancelToken* cancel = nullptr;
    IProgress* progress = nullptr;
    std::string label;

    std::string* text = nullptr;
    std::FILE* file = nullptr;
    std::uint64_t written = 0;
    bool write_failed = false;
};

size_t OnWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t n = size * nmemb;
    if (ctx->text) {
        ctx->text->append(ptr, n);
    } else if (ctx->file) {
        if (std::fwrite(ptr, 1, n, ctx->file) != n) {
            ctx->write_failed = true;
            return 0;
        }
    }
    ctx->written += n;
    return n;
}

int OnTransferInfo(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->cancel && ctx->cancel->IsCancelled())
        return 1;
    if (ctx->progress && dlnow > 0) {
        ctx->progress->OnProgress(ProgressEvent{
            .label = ctx->label,
            .done = static_cast<std::uint64_t>(dlnow),
            .total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0,
        });
    }
    return 0;
}

FetchError MapCurlError(CURLcode rc, const char* errbuf, const std::string& url) {
    std::string detail = (errbuf && errbuf[0] != '\0') ? errbuf : curl_easy_strerror(rc);
    std::string msg = url + ": " + detail;
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
            return FetchError::Make(FetchError::Kind::Timeout, std::move(msg));
        case CURLE_ABORTED_BY_CALLBACK:
            return FetchError::Make(FetchError::Kind::Cancelled, url + ": cancelled");
        case CURLE_PARTIAL_FILE:
            return FetchError::Make(FetchError::Kind::Incomplete, std::move(msg));
        case CURLE_WRITE_ERROR:
            return FetchError::Make(FetchError::Kind::Io, std::move(msg));
        default:
            return FetchError::Make(FetchError::Kind::Network, std::move(msg));
    }
}

void ApplyCommonOptions(CURL* curl,
                        const CurlContentFetcher::Options& opt,
                        const std::string& url,
                        TransferContext& ctx,
                        char* errbuf) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https,file");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opt.max_redirects);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opt.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(opt.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opt.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, OnWrite);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, OnTransferInfo);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
}

std::expected<void, FetchError> CheckHttpStatus(CURL* curl, const std::string& url) {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        return std::unexpected(FetchError::Make(
            FetchError::Kind::HttpStatus, url + ": HTTP " + std::to_string(status), status));
    }
    return {};
}

} // namespace

CurlContentFetcher::CurlContentFetcher() : CurlContentFetcher(Options{}) {}

CurlContentFetcher::CurlContentFetcher(Options options) : options_(std::move(options)) {
    EnsureCurlGlobalInit();
}

std::future<FetchResult<std::string>> CurlContentFetcher::FetchText(const std::string& url,
                                                                    const CancelToken& cancel) {
    return std::async(std::launch::async, [this, url, &cancel] { return FetchTextNow(url, cancel); });
}

std::future<FetchResult<std::uint64_t>> CurlContentFetcher::FetchBinary(
    const std::string& url,
    const std::string& destination_path,
    IProgress* progress,
    const CancelToken& cancel) {
    return std::async(std::launch::async, [this, url, destination_path, progress, &cancel] {
        return FetchBinaryNow(url, destination_path, progress, cancel);
    });
}

FetchResult<std::string> CurlContentFetcher::FetchTextNow(const std::string& url,
                                                          const CancelToken& cancel) const {
    if (cancel.IsCancelled())
        return std::unexpected(FetchError::Make(FetchError::Kind::Cancelled, url + ": cancelled"));

    CurlHandle curl;
    if (!curl.ok())
        return std::unexpected(FetchError::Make(FetchError::Kind::Network, "curl_easy_init failed"));

    std::string body;
    TransferContext ctx;
    ctx.cancel = &cancel;
    ctx.label = url;
    ctx.text = &body;

    char errbuf[CURL_ERROR_SIZE]{};
    ApplyCommonOptions(curl.get(), options_, url, ctx, errbuf);

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK)
        return std::unexpected(MapCurlError(rc, errbuf, url));
    if (auto st = CheckHttpStatus(curl.get(), url); !st)
        return std::unexpected(st.error());

    return body;
}

FetchResult<std::uint64_t> CurlContentFetcher::FetchBinaryNow(const std::string& url,
                                                              const std::string& destination_path,
                                                              IProgress* progress,
                                                              const CancelToken& cancel) const {
    if (cancel.IsCancelled())
        return std::unexpected(FetchError::Make(FetchError::Kind::Cancelled, url + ": cancelled"));

    CurlHandle curl;
    if (!curl.ok())
        return std::unexpected(FetchError::Make(FetchError::Kind::Network, "curl_easy_init failed"));

    const std::string part_path = destination_path + ".part";
    FilePtr file(std::fopen(part_path.c_str(), "wbx"));
    if (!file) {
        return std::unexpected(FetchError::Make(
            FetchError::Kind::Io, "cannot create " + part_path + " (" + std::strerror(errno) + ")"));
    }

    // Removes the part file on every early return.
    struct PartGuard {
        const std::string& path;
        bool keep = false;
        ~PartGuard() {
            if (!keep) std::remove(path.c_str());
        }
    } guard{part_path};

    TransferContext ctx;
    ctx.cancel = &cancel;
    ctx.progress = progress;
    ctx.label = url;
    ctx.file = file.get();

    char errbuf[CURL_ERROR_SIZE]{};
    ApplyCommonOptions(curl.get(), options_, url, ctx, errbuf);

    LogDebug("GET %s -> %s", url.c_str(), destination_path.c_str());
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        if (ctx.write_failed) {
            return std::unexpected(
                FetchError::Make(FetchError::Kind::Io, "write failed: " + part_path));
        }
        return std::unexpected(MapCurlError(rc, errbuf, url));
    }
    if (auto st = CheckHttpStatus(curl.get(), url); !st)
        return std::unexpected(st.error());

    curl_off_t expected = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &expected);
    if (expected >= 0 && static_cast<std::uint64_t>(expected) != ctx.written) {
        return std::unexpected(FetchError::Make(
            FetchError::Kind::Incomplete,
            url + ": received " + std::to_string(ctx.written) + " of " +
                std::to_string(static_cast<long long>(expected)) + " bytes"));
    }

    if (std::fflush(file.get()) != 0 || std::fclose(file.release()) != 0) {
        return std::unexpected(FetchError::Make(FetchError::Kind::Io, "flush failed: " + part_path));
    }

    if (std::rename(part_path.c_str(), destination_path.c_str()) != 0) {
        return std::unexpected(FetchError::Make(
            FetchError::Kind::Io,
            "rename to " + destination_path + " failed (" + std::strerror(errno) + ")"));
    }
    guard.keep = true;

    LogDebug("Downloaded %llu bytes from %s", static_cast<unsigned long long>(ctx.written), url.c_str());
    return ctx.written;
}

} // namespace appcast
