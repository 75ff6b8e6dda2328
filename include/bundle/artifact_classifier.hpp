#pragma once

#include "bundle/artifact.hpp"
#include "bundle/file_ops.hpp"

#include <memory>
#include <string>
#include <vector>

namespace curator {

struct Classification {
    std::vector<ArtifactDescriptor> libraries;
    // Staged location is cleared for every incidental file that is gone.
    std::vector<ArtifactDescriptor> incidental;
    CleanupReport cleanup;
};

// Splits staged files into dynamic libraries and everything else, then
// deletes the incidental copies from the scratch directory.
class ArtifactClassifier {
  public:
    static constexpr const char* kDefaultLibrarySuffix = ".dylib";

    ArtifactClassifier();
    explicit ArtifactClassifier(std::string library_suffix,
                                std::shared_ptr<const IFileOps> file_ops = nullptr);

    bool IsLibrary(const ArtifactDescriptor& artifact) const;

    Classification Classify(std::vector<ArtifactDescriptor> all) const;

    const std::string& LibrarySuffix() const { return suffix_; }

  private:
    std::string suffix_;
    std::shared_ptr<const IFileOps> file_ops_;
};

} // namespace curator
