#pragma once

#include "appcast/io/progress.hpp"
#include "appcast/util/cancel.hpp"

#include <cstdint>
#include <expected>
#include <future>
#include <string>

namespace appcast {

struct FetchError {
    enum class Kind {
        Network,
        Timeout,
        HttpStatus,
        Incomplete,
        Cancelled,
        Io,
    };

    Kind kind = Kind::Network;
    long http_status = 0;
    std::string message;

    static FetchError Make(Kind kind, std::string message, long http_status = 0) {
        return {.kind = kind, .http_status = http_status, .message = std::move(message)};
    }
};

const char* ToString(FetchError::Kind kind);

template <typename T>
using FetchResult = std::expected<T, FetchError>;

// Retrieves feed text and artifact bytes. Both calls return immediately; the
// transfer completes on the returned future. Implementations report every
// failure through FetchError and never throw from the future.
class IContentFetcher {
public:
    virtual ~IContentFetcher() = default;

    virtual std::future<FetchResult<std::string>> FetchText(const std::string& url,
                                                            const CancelToken& cancel) = 0;

    // Writes the artifact to destination_path only once the whole body has
    // arrived; the value is the number of bytes written.
    virtual std::future<FetchResult<std::uint64_t>> FetchBinary(const std::string& url,
                                                                const std::string& destination_path,
                                                                IProgress* progress,
                                                                const CancelToken& cancel) = 0;
};

} // namespace appcast
