#pragma once
#include <cstdint>
#include <string_view>

namespace curator {

struct ProgressEvent {
    std::string_view tag;
    std::uint64_t files_done = 0;
    std::uint64_t bytes_done = 0;
    // 0 when the bundle size is not known up front (archive bundles).
    std::uint64_t bytes_total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace curator
