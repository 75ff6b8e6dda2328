#pragma once
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace curator::config {

class CuratorConfigFromFile {
public:
    static constexpr const char* kDefaultPath = "/etc/bundle-curator/curator.conf";

    // Empty means the default scratch root.
    std::string scratch_root;
    std::string library_suffix = ".dylib";
    LogLevel log_level = LogLevel::Info;
    bool progress = true;
    std::uint64_t copy_buffer_bytes = 64 * 1024;
    bool fsync_staged_files = false;
    std::optional<std::string> app_index;

    Result LoadFile(const std::string &path);
    Result LoadString(const std::string &json_text);

    void Reset();
};

} // namespace curator::config
