#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace curator {

using ArtifactId = std::uint64_t;
using KeepSet = std::set<ArtifactId>;

// Process-wide, monotonically increasing, never 0.
ArtifactId NextArtifactId();

// One file copied out of a bundle.
struct ArtifactDescriptor {
    ArtifactId id = 0;
    std::string name;
    std::string original_path;
    std::uint64_t size_bytes = 0;
    std::optional<std::filesystem::path> staged_location;

    std::string FormattedSize() const;
    ArtifactDescriptor WithoutStagedLocation() const;
};

// "0 bytes", "512 bytes", "1.5 KB", "12.3 MB" (decimal units).
std::string FormatByteCount(std::uint64_t bytes);

} // namespace curator
