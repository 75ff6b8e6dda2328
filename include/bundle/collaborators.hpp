#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace curator {

// Maps an application identifier to its installed bundle directory.
class IBundleDirectoryResolver {
  public:
    virtual ~IBundleDirectoryResolver() = default;
    virtual std::optional<std::filesystem::path>
    ResolveBundleDirectory(std::string_view application_id) const = 0;
};

// Shows a directory to the user. Fire-and-forget.
class IFileRevealer {
  public:
    virtual ~IFileRevealer() = default;
    virtual void Reveal(const std::filesystem::path& dir) = 0;
};

// Resolver backed by a JSON index:
//   {"apps": [{"id": "com.example.app", "name": "Example", "bundle": "Example.app"}]}
// Relative bundle paths are taken relative to the index file.
class JsonAppIndexResolver final : public IBundleDirectoryResolver {
  public:
    struct Entry {
        std::string name;
        std::filesystem::path bundle;
    };

    static Result LoadFromFile(const std::string& path, JsonAppIndexResolver& out);
    static Result LoadFromString(const std::string& json_text,
                                 const std::filesystem::path& base_dir,
                                 JsonAppIndexResolver& out);

    std::optional<std::filesystem::path>
    ResolveBundleDirectory(std::string_view application_id) const override;

    std::optional<std::string> DisplayNameFor(std::string_view application_id) const;
    std::size_t Size() const { return entries_.size(); }

  private:
    std::unordered_map<std::string, Entry> entries_;
};

class LoggingFileRevealer final : public IFileRevealer {
  public:
    void Reveal(const std::filesystem::path& dir) override;
};

} // namespace curator
