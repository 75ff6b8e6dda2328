#pragma once

#include "bundle/artifact.hpp"
#include "bundle/file_ops.hpp"
#include "bundle/progress.hpp"
#include "bundle/scratch_area.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace curator {

class IBundleSource;

class BundleExtractor {
  public:
    struct Options {
        // Empty means ScratchArea::DefaultRoot().
        std::filesystem::path scratch_root;
        std::size_t copy_buffer_bytes = 64 * 1024;
        bool fsync_staged_files = false;

        // Polled between files and between copy blocks.
        const std::atomic_bool* cancel = nullptr;
        IProgress* progress_sink = nullptr;
    };

    BundleExtractor();
    explicit BundleExtractor(Options opt, std::shared_ptr<const IFileOps> file_ops = nullptr);

    /**
     * @brief Copy every regular file of a bundle into a fresh scratch directory.
     *
     * The bundle root is a directory tree or an archive of one. Files are
     * staged flat under <scratch_root>/<destination_folder_name>; clashing
     * base names get a numeric suffix. On failure or cancellation nothing
     * staged by this call is left behind.
     *
     * @param lease_out When non-null, receives the scratch lease on success so
     *                  the caller keeps exclusive use of the directory.
     */
    Result Extract(const std::filesystem::path& bundle_root,
                   std::string_view destination_folder_name,
                   std::vector<ArtifactDescriptor>& out,
                   ScratchLease* lease_out = nullptr) const;

    std::filesystem::path DestinationFor(std::string_view destination_folder_name) const;

  private:
    Result StageAll(IBundleSource& source,
                    const std::filesystem::path& dest,
                    std::string_view tag,
                    std::vector<ArtifactDescriptor>& out) const;

    bool Cancelled() const;

    Options opt_{};
    std::shared_ptr<const IFileOps> file_ops_;
};

} // namespace curator
