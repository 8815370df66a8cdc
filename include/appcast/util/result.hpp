#pragma once
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace appcast {

// Status of an operation that produces no value. `err` is an errno value or
// one of the appcast::errc codes.
struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    // "<what> (<strerror(e)>)"
    static Result FromErrno(const std::string& what, int e = errno) {
        return Fail(e, what + " (" + std::strerror(e) + ")");
    }
};

} // namespace appcast
