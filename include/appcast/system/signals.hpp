#pragma once

#include "appcast/util/cancel.hpp"

namespace appcast {

// SIGINT/SIGTERM raise `token`; the token must outlive the process's use of it.
void InstallSignalHandlers(CancelToken& token);

} // namespace appcast
