#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <atomic>
#include <string>

namespace curator {

// Feeds libarchive from an IReader. When `cancel` is set, the next read
// callback fails with EINTR and libarchive reports a fatal error.
int OpenArchiveFromReader(struct archive* ar, IReader& reader, const std::atomic_bool* cancel = nullptr);
std::string ArchiveErr(struct archive* ar);

} // namespace curator
