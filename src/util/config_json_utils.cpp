#include "util/config_json_utils.hpp"

#include <fstream>

namespace curator::config::detail {

namespace {

// Present but of the wrong type is an error; absent is not.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, CuratorConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "ScratchRoot", cfg.scratch_root, err))
        return false;

    if (!GetStringIfPresent(j, "LibrarySuffix", cfg.library_suffix, err))
        return false;
    if (cfg.library_suffix.size() < 2 || cfg.library_suffix.front() != '.') {
        err = "LibrarySuffix must start with '.' (got \"" + cfg.library_suffix + "\")";
        return false;
    }

    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err))
            return false;
        if (!level.empty()) {
            auto parsed = ParseLogLevel(level);
            if (!parsed) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            cfg.log_level = *parsed;
        }
    }

    if (!GetBoolIfPresent(j, "Progress", cfg.progress, err))
        return false;

    if (!GetU64IfPresent(j, "CopyBufferBytes", cfg.copy_buffer_bytes, err))
        return false;
    if (cfg.copy_buffer_bytes == 0) {
        err = "CopyBufferBytes must be greater than 0";
        return false;
    }

    if (!GetBoolIfPresent(j, "FsyncStagedFiles", cfg.fsync_staged_files, err))
        return false;

    {
        std::string index;
        if (!GetStringIfPresent(j, "AppIndex", index, err))
            return false;
        if (!index.empty())
            cfg.app_index = index;
    }

    return true;
}

} // namespace curator::config::detail
