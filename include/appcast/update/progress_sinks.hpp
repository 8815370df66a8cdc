#pragma once

#include "appcast/io/progress.hpp"

#include <string>

namespace appcast {

// Single-line "\r[file] 42% 1.2/2.9 MiB" progress on stderr.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    int last_pct_ = -1;
    std::string last_label_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace appcast
