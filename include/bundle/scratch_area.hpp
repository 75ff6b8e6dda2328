#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string_view>

namespace curator {

// Per-application staging directories under one scratch root.
class ScratchArea {
  public:
    explicit ScratchArea(std::filesystem::path root);

    // <temp dir>/ExtractedDylibs
    static std::filesystem::path DefaultRoot();

    const std::filesystem::path& Root() const { return root_; }

    // The folder name is sanitized again, so it always maps to a direct child of Root().
    std::filesystem::path DirectoryFor(std::string_view folder_name) const;

  private:
    std::filesystem::path root_;
};

// Exclusive in-process claim on one scratch directory. Two extractions into
// the same directory cannot overlap; the second Acquire() fails with EBUSY.
class ScratchLease {
  public:
    static Result Acquire(const std::filesystem::path& dir, ScratchLease& out);

    ScratchLease() = default;
    ScratchLease(const ScratchLease&) = delete;
    ScratchLease& operator=(const ScratchLease&) = delete;
    ScratchLease(ScratchLease&& other) noexcept;
    ScratchLease& operator=(ScratchLease&& other) noexcept;
    ~ScratchLease();

    bool Held() const { return !key_.empty(); }
    const std::filesystem::path& Dir() const { return dir_; }
    void Release();

    static bool IsLeased(const std::filesystem::path& dir);

  private:
    static std::string KeyFor(const std::filesystem::path& dir);

    std::filesystem::path dir_;
    std::string key_;
};

} // namespace curator
