#include "bundle/collaborators.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fs = std::filesystem;

namespace curator {

using json = nlohmann::json;

namespace {

// Absent leaves `out` untouched; present with another type is an error.
bool GetStringField(const json& item, const char* key, std::string& out) {
    auto it = item.find(key);
    if (it == item.end())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

Result JsonAppIndexResolver::LoadFromFile(const std::string& path, JsonAppIndexResolver& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ENOENT, "cannot open app index: " + path);
    }
    std::stringstream ss;
    ss << is.rdbuf();
    return LoadFromString(ss.str(), fs::path(path).parent_path(), out);
}

Result JsonAppIndexResolver::LoadFromString(const std::string& json_text,
                                            const fs::path& base_dir,
                                            JsonAppIndexResolver& out) {
    out.entries_.clear();

    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Result::Fail(-1, std::string("invalid JSON in app index: ") + e.what());
    }

    if (!j.is_object() || !j.contains("apps") || !j["apps"].is_array()) {
        return Result::Fail(-1, "app index must be an object with an 'apps' array");
    }

    for (const auto& item : j["apps"]) {
        if (!item.is_object()) {
            out.entries_.clear();
            return Result::Fail(-1, "app index entries must be objects");
        }
        std::string id;
        std::string bundle;
        std::string name;
        if (!GetStringField(item, "id", id) || !GetStringField(item, "bundle", bundle) ||
            !GetStringField(item, "name", name)) {
            out.entries_.clear();
            return Result::Fail(-1, "app index fields 'id', 'name' and 'bundle' must be strings");
        }
        if (id.empty() || bundle.empty()) {
            out.entries_.clear();
            return Result::Fail(-1, "app index entry needs 'id' and 'bundle'");
        }

        Entry entry;
        entry.name = name.empty() ? id : name;
        entry.bundle = fs::path(bundle);
        if (entry.bundle.is_relative() && !base_dir.empty()) {
            entry.bundle = base_dir / entry.bundle;
        }
        if (!out.entries_.emplace(id, std::move(entry)).second) {
            out.entries_.clear();
            return Result::Fail(-1, "duplicate app id in index: " + id);
        }
    }

    LogDebug("app index: %zu entries", out.entries_.size());
    return Result::Ok();
}

std::optional<fs::path>
JsonAppIndexResolver::ResolveBundleDirectory(std::string_view application_id) const {
    auto it = entries_.find(std::string(application_id));
    if (it == entries_.end())
        return std::nullopt;
    return it->second.bundle;
}

std::optional<std::string> JsonAppIndexResolver::DisplayNameFor(std::string_view application_id) const {
    auto it = entries_.find(std::string(application_id));
    if (it == entries_.end())
        return std::nullopt;
    return it->second.name;
}

void LoggingFileRevealer::Reveal(const fs::path& dir) {
    LogInfo("Retained libraries are in %s", dir.c_str());
    std::printf("%s\n", dir.c_str());
    std::fflush(stdout);
}

} // namespace curator
