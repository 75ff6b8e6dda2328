#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace curator {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeEntryPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

// Last component of a '/'-separated path.
inline std::string_view EntryBaseName(std::string_view path) {
    const auto pos = path.rfind('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

inline bool EndsWithIgnoreCase(std::string_view s, std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    const auto tail = s.substr(s.size() - suffix.size());
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i])) !=
            std::tolower(static_cast<unsigned char>(suffix[i]))) {
            return false;
        }
    }
    return true;
}

// Turn an application display name into a single path component. Path
// separators become '-'; "." and ".." are spelled with dashes and an empty
// name becomes "Unknown".
inline std::string SanitizeFolderName(std::string_view display_name) {
    if (display_name.empty()) return "Unknown";

    std::string out;
    out.reserve(display_name.size());
    for (char c : display_name) {
        if (c == '/' || c == '\\' || c == ':') {
            out.push_back('-');
        } else {
            out.push_back(c);
        }
    }
    if (out == "." || out == "..") return std::string(out.size(), '-');
    return out;
}

} // namespace curator
