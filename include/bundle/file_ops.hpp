#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

namespace curator {

// Tally of best-effort deletions. `missing` targets were already gone.
struct CleanupReport {
    std::size_t removed = 0;
    std::size_t missing = 0;
    std::size_t failed = 0;

    bool Clean() const { return failed == 0; }
    void Merge(const CleanupReport& other) {
        removed += other.removed;
        missing += other.missing;
        failed += other.failed;
    }
};

class IFileOps {
  public:
    virtual ~IFileOps() = default;

    // `existed` is false when there was nothing to remove; that is not a failure.
    virtual Result RemoveFile(const std::filesystem::path& p, bool& existed) const = 0;
    virtual Result RemoveTree(const std::filesystem::path& p, bool& existed) const = 0;
    virtual Result CreateDirectories(const std::filesystem::path& p) const = 0;
};

std::shared_ptr<const IFileOps> DefaultFileOps();

enum class RemoveKind { File, Tree };

// Deletes `p`, logs a failure at WARN and records the outcome. Never fails.
void RemoveBestEffort(const IFileOps& ops,
                      RemoveKind kind,
                      const std::filesystem::path& p,
                      CleanupReport& report);

} // namespace curator
