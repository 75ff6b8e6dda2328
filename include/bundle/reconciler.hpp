#pragma once

#include "bundle/artifact.hpp"
#include "bundle/file_ops.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace curator {

// Applies the outcome of a curation to the scratch directory. Deletions are
// best-effort: one failure never stops the rest, and absent targets count as
// done.
class Reconciler {
  public:
    Reconciler();
    explicit Reconciler(std::shared_ptr<const IFileOps> file_ops);

    // Deletes every staged library whose id is not in `keep`. Returns `scratch_dir`.
    std::filesystem::path Finalize(const std::vector<ArtifactDescriptor>& libraries,
                                   const KeepSet& keep,
                                   const std::filesystem::path& scratch_dir,
                                   CleanupReport* report = nullptr) const;

    // Removes the whole scratch directory.
    CleanupReport Abort(const std::filesystem::path& scratch_dir) const;

  private:
    std::shared_ptr<const IFileOps> file_ops_;
};

} // namespace curator
