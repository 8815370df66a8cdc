#pragma once

namespace appcast::errc {

// Values for Result::err that are not errno codes. Kept negative so they
// never collide with errno.
inline constexpr int kGeneric = -1;
inline constexpr int kInvalidArgument = -2;
inline constexpr int kConfig = -3;
inline constexpr int kCrypto = -4;
inline constexpr int kIo = -5;
inline constexpr int kCancelled = -6;

} // namespace appcast::errc
