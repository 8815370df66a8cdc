#pragma once

#include "appcast/util/result.hpp"

#include <expected>
#include <string>

namespace appcast {

// Last path segment of `url` without query or fragment, restricted to
// [A-Za-z0-9._-]. Returns "artifact" when nothing usable remains.
std::string RemoteFileName(const std::string& url);

// 32 lowercase hex characters from the OpenSSL CSPRNG.
std::expected<std::string, std::string> GenerateUniqueToken();

// $TMPDIR when set and usable, /tmp otherwise.
std::string SystemTempDirectory();

// Owns the temporary artifact for one download. The file at Path() is removed
// when the session is destroyed unless it was released for execution.
class DownloadSession {
public:
    enum class State {
        Pending,
        Completed,
        Failed,
        Released,
    };

    // Path is <temp_dir>/<unique token><remote file name>; temp_dir defaults
    // to SystemTempDirectory().
    static std::expected<DownloadSession, std::string> Create(std::string artifact_url,
                                                              const std::string& temp_dir = {});

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;
    DownloadSession(DownloadSession&& other) noexcept;
    DownloadSession& operator=(DownloadSession&& other) noexcept;
    ~DownloadSession();

    const std::string& ArtifactUrl() const { return artifact_url_; }
    const std::string& Path() const { return path_; }
    State GetState() const { return state_; }

    void MarkCompleted();
    void MarkFailed();

    // Deletes the artifact. A file that is already gone is not an error.
    Result Discard();

    // Transfers ownership of the file to the caller and returns its path.
    std::string Release();

private:
    DownloadSession(std::string artifact_url, std::string path);
    void Cleanup();

    std::string artifact_url_;
    std::string path_;
    State state_ = State::Pending;
};

const char* ToString(DownloadSession::State state);

} // namespace appcast
