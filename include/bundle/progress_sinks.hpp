#pragma once

#include "bundle/progress.hpp"

namespace curator {

// Single-line "\r" progress on stderr.
class ConsoleProgressSink final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override;
    void Finish();
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace curator
