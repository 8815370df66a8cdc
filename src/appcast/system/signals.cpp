// signals.cpp - SIGINT/SIGTERM cancel the running check.

#include "appcast/system/signals.hpp"

#include <atomic>
#include <csignal>

namespace appcast {

namespace {
std::atomic<CancelToken*> g_token{nullptr};
} // namespace

static void HandleSignal(int) {
    if (CancelToken* token = g_token.load(std::memory_order_relaxed))
        token->Cancel();
}

void InstallSignalHandlers(CancelToken& token) {
    g_token.store(&token, std::memory_order_relaxed);
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

} // namespace appcast
