#pragma once

#include "io/file_reader.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace curator {

struct BundleEntryInfo {
    // '/'-separated path relative to the bundle root.
    std::string relative_path;
    std::uint64_t size = 0;
};

// Sequential walk over the regular files of a bundle.
class IBundleSource {
  public:
    virtual ~IBundleSource() = default;

    // Move to the next regular file. Returns Ok + eof=true at the end.
    virtual Result Next(BundleEntryInfo& out, bool& eof) = 0;

    // Stream the current entry. The reader is valid until the next call to Next().
    virtual Result OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) = 0;

    virtual Result SkipCurrent() = 0;

    // Sum of regular file sizes, when cheaply known.
    virtual std::optional<std::uint64_t> TotalBytes() const { return std::nullopt; }
};

class DirectoryBundleSource final : public IBundleSource {
  public:
    Result Open(const std::filesystem::path& root);

    Result Next(BundleEntryInfo& out, bool& eof) override;
    Result OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) override;
    Result SkipCurrent() override { return Result::Ok(); }
    std::optional<std::uint64_t> TotalBytes() const override { return total_bytes_; }

  private:
    std::filesystem::path root_;
    std::filesystem::recursive_directory_iterator it_;
    std::filesystem::path current_;
    bool started_ = false;
    std::optional<std::uint64_t> total_bytes_;
};

// Zipped (.ipa) or tarred bundles, read through libarchive.
class ArchiveBundleSource final : public IBundleSource {
  public:
    ArchiveBundleSource() = default;
    ~ArchiveBundleSource() override;

    ArchiveBundleSource(const ArchiveBundleSource&) = delete;
    ArchiveBundleSource& operator=(const ArchiveBundleSource&) = delete;

    Result Open(const std::filesystem::path& archive_path, const std::atomic_bool* cancel = nullptr);

    Result Next(BundleEntryInfo& out, bool& eof) override;
    Result OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) override;
    Result SkipCurrent() override;

  private:
    class EntryReader final : public IReader {
      public:
        explicit EntryReader(ArchiveBundleSource* parent) : parent_(parent) {}
        ssize_t Read(std::span<std::uint8_t> out) override;
        std::optional<std::uint64_t> TotalSize() const override;

      private:
        ArchiveBundleSource* parent_ = nullptr;
    };

    FileReader input_;
    struct archive* ar_ = nullptr;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
};

// Directory roots get a DirectoryBundleSource, regular files an ArchiveBundleSource.
Result OpenBundleSource(const std::filesystem::path& bundle_root,
                        const std::atomic_bool* cancel,
                        std::unique_ptr<IBundleSource>& out);

} // namespace curator
