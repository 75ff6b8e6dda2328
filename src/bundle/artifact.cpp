#include "bundle/artifact.hpp"

#include <array>
#include <atomic>
#include <cstdio>

namespace curator {

namespace {
std::atomic<ArtifactId> g_next_id{1};
} // namespace

ArtifactId NextArtifactId() { return g_next_id.fetch_add(1, std::memory_order_relaxed); }

std::string ArtifactDescriptor::FormattedSize() const { return FormatByteCount(size_bytes); }

ArtifactDescriptor ArtifactDescriptor::WithoutStagedLocation() const {
    ArtifactDescriptor copy = *this;
    copy.staged_location.reset();
    return copy;
}

std::string FormatByteCount(std::uint64_t bytes) {
    if (bytes == 1) return "1 byte";
    if (bytes < 1000) return std::to_string(bytes) + " bytes";

    static constexpr std::array<const char*, 5> kUnits = {"KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes) / 1000.0;
    size_t unit = 0;
    while (value >= 999.95 && unit + 1 < kUnits.size()) {
        value /= 1000.0;
        ++unit;
    }

    char buf[32];
    if (value >= 100.0) {
        std::snprintf(buf, sizeof(buf), "%.0f %s", value, kUnits[unit]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, kUnits[unit]);
    }
    return buf;
}

} // namespace curator
