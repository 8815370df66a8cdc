#include "appcast/net/content_fetcher.hpp"

namespace appcast {

const char* ToString(FetchError::Kind kind) {
    switch (kind) {
        case FetchError::Kind::Network:    return "network";
        case FetchError::Kind::Timeout:    return "timeout";
        case FetchError::Kind::HttpStatus: return "http-status";
        case FetchError::Kind::Incomplete: return "incomplete";
        case FetchError::Kind::Cancelled:  return "cancelled";
        case FetchError::Kind::Io:         return "io";
    }
    return "unknown";
}

} // namespace appcast
