#include "bundle/artifact_classifier.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace curator {

ArtifactClassifier::ArtifactClassifier() : ArtifactClassifier(kDefaultLibrarySuffix) {}

ArtifactClassifier::ArtifactClassifier(std::string library_suffix,
                                       std::shared_ptr<const IFileOps> file_ops)
    : suffix_(library_suffix.empty() ? std::string(kDefaultLibrarySuffix) : std::move(library_suffix)),
      file_ops_(file_ops ? std::move(file_ops) : DefaultFileOps()) {}

bool ArtifactClassifier::IsLibrary(const ArtifactDescriptor& artifact) const {
    return EndsWithIgnoreCase(artifact.name, suffix_);
}

Classification ArtifactClassifier::Classify(std::vector<ArtifactDescriptor> all) const {
    Classification out;
    out.libraries.reserve(all.size());

    for (auto& artifact : all) {
        if (IsLibrary(artifact)) {
            out.libraries.push_back(std::move(artifact));
        } else {
            out.incidental.push_back(std::move(artifact));
        }
    }

    for (auto& artifact : out.incidental) {
        if (!artifact.staged_location)
            continue;

        const std::size_t failed_before = out.cleanup.failed;
        RemoveBestEffort(*file_ops_, RemoveKind::File, *artifact.staged_location, out.cleanup);
        if (out.cleanup.failed == failed_before) {
            artifact = artifact.WithoutStagedLocation();
        }
    }

    LogInfo("Classified %zu files: %zu libraries, %zu incidental (%zu removed, %zu failed)",
            out.libraries.size() + out.incidental.size(),
            out.libraries.size(),
            out.incidental.size(),
            out.cleanup.removed,
            out.cleanup.failed);
    if (out.libraries.empty()) {
        LogInfo("No %s files found", suffix_.c_str());
    }
    return out;
}

} // namespace curator
