#include "appcast/update/download_session.hpp"

#include "appcast/util/errors.hpp"
#include "appcast/util/logger.hpp"

#include <openssl/rand.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace appcast {

namespace {

constexpr const char* kFallbackFileName = "artifact";

bool IsSafeFileChar(unsigned char c) {
    return std::isalnum(c) != 0 || c == '.' || c == '_' || c == '-';
}

bool IsUsableDirectory(const char* path) {
    struct stat st{};
    return path && *path && ::stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

} // namespace

std::string RemoteFileName(const std::string& url) {
    std::string path = url;
    if (auto cut = path.find_first_of("?#"); cut != std::string::npos)
        path.erase(cut);
    if (auto scheme = path.find("://"); scheme != std::string::npos) {
        // Drop "scheme://authority" so a bare host never becomes the file name.
        auto slash = path.find('/', scheme + 3);
        path = (slash == std::string::npos) ? std::string{} : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/')
        path.pop_back();

    const auto last = path.find_last_of('/');
    const std::string segment = (last == std::string::npos) ? path : path.substr(last + 1);

    std::string out;
    out.reserve(segment.size());
    for (char c : segment) {
        if (IsSafeFileChar(static_cast<unsigned char>(c)))
            out.push_back(c);
    }
    if (out.empty() || out == "." || out == "..")
        return kFallbackFileName;
    return out;
}

std::expected<std::string, std::string> GenerateUniqueToken() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
        return std::unexpected("RAND_bytes failed");

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

std::string SystemTempDirectory() {
    const char* env = std::getenv("TMPDIR");
    if (IsUsableDirectory(env))
        return env;
    return "/tmp";
}

const char* ToString(DownloadSession::State state) {
    switch (state) {
        case DownloadSession::State::Pending:   return "Pending";
        case DownloadSession::State::Completed: return "Completed";
        case DownloadSession::State::Failed:    return "Failed";
        case DownloadSession::State::Released:  return "Released";
    }
    return "Unknown";
}

std::expected<DownloadSession, std::string> DownloadSession::Create(std::string artifact_url,
                                                                    const std::string& temp_dir) {
    std::string dir = temp_dir.empty() ? SystemTempDirectory() : temp_dir;
    if (!IsUsableDirectory(dir.c_str()))
        return std::unexpected("temporary directory does not exist: " + dir);
    while (dir.size() > 1 && dir.back() == '/')
        dir.pop_back();

    auto token = GenerateUniqueToken();
    if (!token)
        return std::unexpected(token.error());

    std::string path = dir + "/" + *token + RemoteFileName(artifact_url);
    if (::access(path.c_str(), F_OK) == 0)
        return std::unexpected("temporary artifact path already exists: " + path);

    return DownloadSession(std::move(artifact_url), std::move(path));
}

DownloadSession::DownloadSession(std::string artifact_url, std::string path)
    : artifact_url_(std::move(artifact_url)), path_(std::move(path)) {}

DownloadSession::DownloadSession(DownloadSession&& other) noexcept
    : artifact_url_(std::move(other.artifact_url_)),
      path_(std::move(other.path_)),
      state_(other.state_) {
    other.path_.clear();
    other.state_ = State::Released;
}

DownloadSession& DownloadSession::operator=(DownloadSession&& other) noexcept {
    if (this != &other) {
        Cleanup();
        artifact_url_ = std::move(other.artifact_url_);
        path_ = std::move(other.path_);
        state_ = other.state_;
        other.path_.clear();
        other.state_ = State::Released;
    }
    return *this;
}

DownloadSession::~DownloadSession() { Cleanup(); }

void DownloadSession::MarkCompleted() { state_ = State::Completed; }

void DownloadSession::MarkFailed() {
    state_ = State::Failed;
    if (auto r = Discard(); !r.is_ok())
        LogWarn("%s", r.message().c_str());
}

Result DownloadSession::Discard() {
    if (path_.empty() || state_ == State::Released)
        return Result::Ok();
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        return Result::FromErrno("cannot delete artifact " + path_);
    }
    return Result::Ok();
}

std::string DownloadSession::Release() {
    state_ = State::Released;
    return path_;
}

void DownloadSession::Cleanup() {
    if (state_ == State::Released || path_.empty())
        return;
    if (auto r = Discard(); !r.is_ok())
        LogWarn("%s", r.message().c_str());
}

} // namespace appcast
