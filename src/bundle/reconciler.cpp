#include "bundle/reconciler.hpp"

#include "util/logger.hpp"

namespace fs = std::filesystem;

namespace curator {

Reconciler::Reconciler() : file_ops_(DefaultFileOps()) {}

Reconciler::Reconciler(std::shared_ptr<const IFileOps> file_ops)
    : file_ops_(file_ops ? std::move(file_ops) : DefaultFileOps()) {}

fs::path Reconciler::Finalize(const std::vector<ArtifactDescriptor>& libraries,
                              const KeepSet& keep,
                              const fs::path& scratch_dir,
                              CleanupReport* report) const {
    CleanupReport local;
    std::size_t kept = 0;

    for (const auto& lib : libraries) {
        if (keep.count(lib.id) > 0) {
            ++kept;
            continue;
        }
        if (!lib.staged_location)
            continue;
        RemoveBestEffort(*file_ops_, RemoveKind::File, *lib.staged_location, local);
    }

    LogInfo("Kept %zu of %zu libraries in %s (%zu deleted, %zu failed)",
            kept,
            libraries.size(),
            scratch_dir.c_str(),
            local.removed,
            local.failed);
    if (report)
        report->Merge(local);
    return scratch_dir;
}

CleanupReport Reconciler::Abort(const fs::path& scratch_dir) const {
    CleanupReport report;
    if (scratch_dir.empty())
        return report;
    RemoveBestEffort(*file_ops_, RemoveKind::Tree, scratch_dir, report);
    if (report.Clean()) {
        LogInfo("Discarded scratch directory %s", scratch_dir.c_str());
    }
    return report;
}

} // namespace curator
