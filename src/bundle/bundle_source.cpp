#include "bundle/bundle_source.hpp"

#include "bundle/archive_path_policy.hpp"
#include "bundle/archive_reader_adapter.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace curator {

namespace {

Result FailFs(const std::error_code& ec, const std::string& what, const fs::path& p) {
    return Result::Fail(ec.value(), what + ": " + p.string() + " (" + ec.message() + ")");
}

std::optional<std::uint64_t> SumRegularFiles(const fs::path& root) {
    std::error_code ec;
    std::uint64_t total = 0;
    fs::recursive_directory_iterator it(root, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        const auto st = it->symlink_status(ec);
        if (!ec && fs::is_regular_file(st)) {
            const auto sz = it->file_size(ec);
            if (!ec) total += sz;
        }
        if (ec) break;
        it.increment(ec);
    }
    if (ec) return std::nullopt;
    return total;
}

} // namespace

Result DirectoryBundleSource::Open(const fs::path& root) {
    std::error_code ec;
    const auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        return Result::Fail(ENOENT, "Bundle not found: " + root.string());
    }
    if (!fs::is_directory(st)) {
        return Result::Fail(ENOTDIR, "Bundle is not a directory: " + root.string());
    }

    it_ = fs::recursive_directory_iterator(root, ec);
    if (ec) return FailFs(ec, "Cannot read bundle", root);

    root_ = root;
    started_ = false;
    total_bytes_ = SumRegularFiles(root);
    return Result::Ok();
}

Result DirectoryBundleSource::Next(BundleEntryInfo& out, bool& eof) {
    eof = false;
    std::error_code ec;
    const fs::recursive_directory_iterator end;

    if (started_ && it_ != end) it_.increment(ec);
    started_ = true;

    while (true) {
        if (ec) return FailFs(ec, "Cannot read bundle directory", root_);
        if (it_ == end) {
            eof = true;
            current_.clear();
            return Result::Ok();
        }

        const fs::directory_entry& entry = *it_;
        const auto st = entry.symlink_status(ec);
        if (ec) continue;

        // Symlinks, sockets and the like are not staged.
        if (fs::is_regular_file(st)) {
            current_ = entry.path();
            out.relative_path = current_.lexically_relative(root_).generic_string();
            const auto sz = entry.file_size(ec);
            out.size = ec ? 0 : static_cast<std::uint64_t>(sz);
            return Result::Ok();
        }

        it_.increment(ec);
    }
}

Result DirectoryBundleSource::OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) {
    if (current_.empty()) return Result::Fail(-1, "No current entry");
    auto reader = std::make_unique<FileReader>();
    auto r = FileReader::Open(current_.string(), *reader);
    if (!r.is_ok()) return r;
    out_reader = std::move(reader);
    return Result::Ok();
}

ArchiveBundleSource::~ArchiveBundleSource() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result ArchiveBundleSource::Open(const fs::path& archive_path, const std::atomic_bool* cancel) {
    if (ar_) return Result::Fail(-1, "Bundle already opened");

    auto open_result = FileReader::Open(archive_path.string(), input_);
    if (!open_result.is_ok()) return open_result;

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_all(ar_);
    archive_read_support_format_all(ar_);

    if (OpenArchiveFromReader(ar_, input_, cancel) != ARCHIVE_OK) {
        const std::string em = ArchiveErr(ar_);
        archive_read_free(ar_);
        ar_ = nullptr;
        return Result::Fail(-1, "Cannot read bundle archive " + archive_path.string() + ": " + em);
    }

    return Result::Ok();
}

Result ArchiveBundleSource::Next(BundleEntryInfo& out, bool& eof) {
    eof = false;
    if (!ar_) return Result::Fail(-1, "Bundle not opened");

    if (in_entry_) {
        auto skip = SkipCurrent();
        if (!skip.is_ok()) return skip;
    }

    const ArchivePathPolicy path_policy(/*safe_paths_only=*/true);

    while (true) {
        const int r = archive_read_next_header(ar_, &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(archive_errno(ar_) == EINTR ? ECANCELED : -1,
                                "archive_read_next_header: " + ArchiveErr(ar_));
        }

        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            (void)archive_read_data_skip(ar_);
            continue;
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(cur_entry_), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar_);
            continue;
        }

        out.relative_path = std::move(rel);
        const la_int64_t sz = archive_entry_size(cur_entry_);
        out.size = sz > 0 ? static_cast<std::uint64_t>(sz) : 0;

        in_entry_ = true;
        return Result::Ok();
    }
}

Result ArchiveBundleSource::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    in_entry_ = false;
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_read_data_skip: " + ArchiveErr(ar_));
    }
    return Result::Ok();
}

Result ArchiveBundleSource::OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) {
    if (!in_entry_) return Result::Fail(-1, "No current entry");
    out_reader = std::make_unique<EntryReader>(this);
    return Result::Ok();
}

ssize_t ArchiveBundleSource::EntryReader::Read(std::span<std::uint8_t> out) {
    if (!parent_ || !parent_->in_entry_) return 0;
    const la_ssize_t n = archive_read_data(parent_->ar_, out.data(), out.size());
    if (n < 0) {
        LogDebug("archive_read_data: %s", ArchiveErr(parent_->ar_).c_str());
        return -1;
    }
    if (n == 0) {
        parent_->in_entry_ = false;
        return 0;
    }
    return static_cast<ssize_t>(n);
}

std::optional<std::uint64_t> ArchiveBundleSource::EntryReader::TotalSize() const {
    if (!parent_ || !parent_->cur_entry_) return std::nullopt;
    if (!archive_entry_size_is_set(parent_->cur_entry_)) return std::nullopt;
    const la_int64_t sz = archive_entry_size(parent_->cur_entry_);
    if (sz < 0) return std::nullopt;
    return static_cast<std::uint64_t>(sz);
}

Result OpenBundleSource(const fs::path& bundle_root,
                        const std::atomic_bool* cancel,
                        std::unique_ptr<IBundleSource>& out) {
    std::error_code ec;
    const auto st = fs::status(bundle_root, ec);
    if (ec || !fs::exists(st)) {
        return Result::Fail(ENOENT, "Bundle not found: " + bundle_root.string());
    }

    if (fs::is_directory(st)) {
        auto dir = std::make_unique<DirectoryBundleSource>();
        auto r = dir->Open(bundle_root);
        if (!r.is_ok()) return r;
        out = std::move(dir);
        return Result::Ok();
    }

    if (fs::is_regular_file(st)) {
        auto arc = std::make_unique<ArchiveBundleSource>();
        auto r = arc->Open(bundle_root, cancel);
        if (!r.is_ok()) return r;
        out = std::move(arc);
        return Result::Ok();
    }

    return Result::Fail(-1, "Bundle is neither a directory nor an archive: " + bundle_root.string());
}

} // namespace curator
