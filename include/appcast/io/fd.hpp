#pragma once

#include <string>

namespace appcast {

// Owning file descriptor. Closed on destruction unless released.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    // O_RDONLY | O_CLOEXEC. Invalid on failure with errno preserved.
    static Fd OpenReadOnly(const std::string& path);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    int Release();
    void Reset(int fd = -1);
    void Close() { Reset(); }

  private:
    int fd_{-1};
};

} // namespace appcast
