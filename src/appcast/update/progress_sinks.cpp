#include "appcast/update/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace appcast {

namespace {
std::atomic_bool g_progress_line_active{false};

double ToMiB(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    int pct = -1;
    if (e.total > 0) {
        pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100)
            pct = 100;
    }

    const std::string label(e.label);
    if (label == last_label_ && pct == last_pct_ && pct >= 0)
        return;
    last_label_ = label;
    last_pct_ = pct;

    if (pct >= 0) {
        std::fprintf(stderr,
                     "\r[%s] %3d%% %.1f/%.1f MiB",
                     label.c_str(),
                     pct,
                     ToMiB(e.done),
                     ToMiB(e.total));
    } else {
        std::fprintf(stderr, "\r[%s] %.1f MiB", label.c_str(), ToMiB(e.done));
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (pct >= 100) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace appcast
