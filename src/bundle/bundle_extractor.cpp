#include "bundle/bundle_extractor.hpp"

#include "bundle/bundle_source.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace curator {

namespace {

constexpr std::size_t kDefaultCopyBufferBytes = 64 * 1024;

std::string LowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// "libfoo.dylib" -> "libfoo_2.dylib". Dotfiles and names without an
// extension get the counter appended.
std::string NumberedName(const std::string& base, unsigned n) {
    const auto dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return base + "_" + std::to_string(n);
    return base.substr(0, dot) + "_" + std::to_string(n) + base.substr(dot);
}

// Staged names are compared case-insensitively so the flat layout also
// holds on case-insensitive file systems.
class StagedNames {
  public:
    std::string Claim(const std::string& base) {
        std::string candidate = base;
        unsigned n = 0;
        while (!used_.insert(LowerCopy(candidate)).second) {
            candidate = NumberedName(base, ++n);
        }
        return candidate;
    }

  private:
    std::unordered_set<std::string> used_;
};

} // namespace

BundleExtractor::BundleExtractor() : file_ops_(DefaultFileOps()) {}

BundleExtractor::BundleExtractor(Options opt, std::shared_ptr<const IFileOps> file_ops)
    : opt_(std::move(opt)), file_ops_(file_ops ? std::move(file_ops) : DefaultFileOps()) {}

bool BundleExtractor::Cancelled() const {
    return opt_.cancel && opt_.cancel->load(std::memory_order_relaxed);
}

fs::path BundleExtractor::DestinationFor(std::string_view destination_folder_name) const {
    return ScratchArea(opt_.scratch_root).DirectoryFor(destination_folder_name);
}

Result BundleExtractor::Extract(const fs::path& bundle_root,
                                std::string_view destination_folder_name,
                                std::vector<ArtifactDescriptor>& out,
                                ScratchLease* lease_out) const {
    out.clear();
    const fs::path dest = DestinationFor(destination_folder_name);

    ScratchLease lease;
    auto lease_result = ScratchLease::Acquire(dest, lease);
    if (!lease_result.is_ok()) {
        LogError("extract %s: %s", bundle_root.c_str(), lease_result.msg.c_str());
        return lease_result;
    }

    std::unique_ptr<IBundleSource> source;
    auto source_result = OpenBundleSource(bundle_root, opt_.cancel, source);
    if (!source_result.is_ok()) {
        LogError("extract: %s", source_result.msg.c_str());
        return source_result;
    }

    // Whatever an earlier run left here is never reused.
    CleanupReport stale;
    RemoveBestEffort(*file_ops_, RemoveKind::Tree, dest, stale);
    if (!stale.Clean()) {
        return Result::Fail(EEXIST, "Cannot clear stale scratch directory: " + dest.string());
    }
    auto create_result = file_ops_->CreateDirectories(dest);
    if (!create_result.is_ok()) {
        LogError("extract: %s", create_result.msg.c_str());
        return Result::Fail(create_result.err,
                            "Cannot create scratch directory: " + create_result.msg);
    }

    LogInfo("Extracting %s -> %s", bundle_root.c_str(), dest.c_str());

    std::vector<ArtifactDescriptor> staged;
    auto stage_result = StageAll(*source, dest, destination_folder_name, staged);
    if (!stage_result.is_ok()) {
        CleanupReport rollback;
        RemoveBestEffort(*file_ops_, RemoveKind::Tree, dest, rollback);
        if (stage_result.err == ECANCELED) {
            LogInfo("Extraction cancelled after %zu files; discarded %s",
                    staged.size(),
                    dest.c_str());
        } else {
            LogError("Extraction failed: %s", stage_result.msg.c_str());
        }
        return stage_result;
    }

    LogInfo("Extracted %zu files from %s", staged.size(), bundle_root.c_str());
    out = std::move(staged);
    if (lease_out) {
        *lease_out = std::move(lease);
    }
    return Result::Ok();
}

Result BundleExtractor::StageAll(IBundleSource& source,
                                 const fs::path& dest,
                                 std::string_view tag,
                                 std::vector<ArtifactDescriptor>& out) const {
    std::vector<std::uint8_t> buf(opt_.copy_buffer_bytes ? opt_.copy_buffer_bytes
                                                         : kDefaultCopyBufferBytes);
    StagedNames names;

    ProgressEvent event{};
    event.tag = tag;
    event.bytes_total = source.TotalBytes().value_or(0);

    auto copy_entry = [&](IReader& reader,
                          const fs::path& staged_path,
                          std::uint64_t& copied) -> Result {
        FileWriter writer;
        auto cr = FileWriter::Create(staged_path.string(), writer);
        if (!cr.is_ok())
            return cr;

        while (true) {
            if (Cancelled())
                return Result::Fail(ECANCELED, "Extraction cancelled");

            const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
            if (n == 0)
                break;
            if (n < 0) {
                if (Cancelled())
                    return Result::Fail(ECANCELED, "Extraction cancelled");
                const int err = errno;
                return Result::Fail(err ? err : -1,
                                    "Read failed while staging " + staged_path.filename().string());
            }

            auto wr = writer.WriteAll(
                std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
            if (!wr.is_ok())
                return wr;

            copied += static_cast<std::uint64_t>(n);
            event.bytes_done += static_cast<std::uint64_t>(n);
        }

        if (opt_.fsync_staged_files) {
            auto fr = writer.FsyncNow();
            if (!fr.is_ok())
                return fr;
        }
        return writer.Close();
    };

    bool eof = false;
    BundleEntryInfo entry{};

    while (true) {
        if (Cancelled())
            return Result::Fail(ECANCELED, "Extraction cancelled");

        auto next_result = source.Next(entry, eof);
        if (!next_result.is_ok())
            return next_result;
        if (eof)
            break;

        const std::string name(EntryBaseName(entry.relative_path));
        const fs::path staged_path = dest / names.Claim(name);

        std::unique_ptr<IReader> reader;
        auto open_result = source.OpenCurrentEntryReader(reader);
        if (!open_result.is_ok())
            return open_result;

        std::uint64_t copied = 0;
        auto copy_result = copy_entry(*reader, staged_path, copied);
        if (!copy_result.is_ok()) {
            if (copy_result.err == ECANCELED)
                return copy_result;
            return Result::Fail(copy_result.err,
                                "Cannot stage " + entry.relative_path + ": " + copy_result.msg);
        }

        ArtifactDescriptor descriptor;
        descriptor.id = NextArtifactId();
        descriptor.name = name;
        descriptor.original_path = entry.relative_path;
        descriptor.size_bytes = copied;
        descriptor.staged_location = staged_path;

        LogDebug("staged %s -> %s (%llu bytes)",
                 entry.relative_path.c_str(),
                 staged_path.filename().c_str(),
                 (unsigned long long)copied);
        out.push_back(std::move(descriptor));

        ++event.files_done;
        if (opt_.progress_sink) {
            opt_.progress_sink->OnProgress(event);
        }
    }

    return Result::Ok();
}

} // namespace curator
