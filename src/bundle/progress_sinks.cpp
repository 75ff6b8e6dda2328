#include "bundle/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace curator {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (e.bytes_total > 0) {
        int pct = static_cast<int>((e.bytes_done * 100ULL) / e.bytes_total);
        if (pct > 100)
            pct = 100;
        std::fprintf(stderr,
                     "\r[%.*s] %3d%% | %llu files",
                     (int)e.tag.size(),
                     e.tag.data(),
                     pct,
                     (unsigned long long)e.files_done);
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %llu bytes | %llu files",
                     (int)e.tag.size(),
                     e.tag.data(),
                     (unsigned long long)e.bytes_done,
                     (unsigned long long)e.files_done);
    }
    std::fflush(stderr);
    g_progress_line_active.store(true, std::memory_order_relaxed);
}

void ConsoleProgressSink::Finish() { ClearProgressLine(); }

bool IsProgressLineActive() { return g_progress_line_active.load(std::memory_order_relaxed); }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false, std::memory_order_relaxed)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace curator
