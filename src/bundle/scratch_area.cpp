#include "bundle/scratch_area.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <mutex>
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace curator {

namespace {

std::mutex g_lease_mu;

std::set<std::string>& LeasedDirs() {
    static std::set<std::string> dirs;
    return dirs;
}

} // namespace

ScratchArea::ScratchArea(fs::path root) : root_(root.empty() ? DefaultRoot() : std::move(root)) {}

fs::path ScratchArea::DefaultRoot() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec || tmp.empty()) tmp = "/tmp";
    return tmp / "ExtractedDylibs";
}

fs::path ScratchArea::DirectoryFor(std::string_view folder_name) const {
    return root_ / SanitizeFolderName(folder_name);
}

std::string ScratchLease::KeyFor(const fs::path& dir) {
    std::error_code ec;
    fs::path abs = fs::absolute(dir, ec);
    if (ec) abs = dir;
    return abs.lexically_normal().string();
}

Result ScratchLease::Acquire(const fs::path& dir, ScratchLease& out) {
    out.Release();
    const std::string key = KeyFor(dir);

    std::lock_guard<std::mutex> lk(g_lease_mu);
    if (!LeasedDirs().insert(key).second) {
        return Result::Fail(EBUSY, "scratch directory busy: " + key);
    }
    out.dir_ = dir;
    out.key_ = key;
    LogDebug("lease acquired: %s", key.c_str());
    return Result::Ok();
}

ScratchLease::ScratchLease(ScratchLease&& other) noexcept
    : dir_(std::move(other.dir_)), key_(std::move(other.key_)) {
    other.dir_.clear();
    other.key_.clear();
}

ScratchLease& ScratchLease::operator=(ScratchLease&& other) noexcept {
    if (this == &other)
        return *this;
    Release();
    dir_ = std::move(other.dir_);
    key_ = std::move(other.key_);
    other.dir_.clear();
    other.key_.clear();
    return *this;
}

ScratchLease::~ScratchLease() { Release(); }

void ScratchLease::Release() {
    if (key_.empty()) return;
    {
        std::lock_guard<std::mutex> lk(g_lease_mu);
        LeasedDirs().erase(key_);
    }
    LogDebug("lease released: %s", key_.c_str());
    key_.clear();
    dir_.clear();
}

bool ScratchLease::IsLeased(const fs::path& dir) {
    const std::string key = KeyFor(dir);
    std::lock_guard<std::mutex> lk(g_lease_mu);
    return LeasedDirs().count(key) > 0;
}

} // namespace curator
