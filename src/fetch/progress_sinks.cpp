#include "fetch/progress_sinks.hpp"

#include <cstdio>

namespace espkit {

namespace {
bool g_progress_line_active = false;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string cur_item(e.item);
    if (cur_item != last_item_) {
        last_item_ = cur_item;
        item_finished_ = false;
        next_ = 0;
    }
    if (item_finished_) return;

    const bool complete = e.total > 0 && e.done >= e.total;
    if (e.done < next_ && !complete) return;
    next_ = e.done + min_step_;

    if (e.total > 0) {
        int pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100)
            pct = 100;
        std::fprintf(stderr,
                     "\r[%.*s] %3d%% %llu/%llu KiB",
                     (int)e.item.size(),
                     e.item.data(),
                     pct,
                     (unsigned long long)(e.done / 1024),
                     (unsigned long long)(e.total / 1024));
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %llu KiB",
                     (int)e.item.size(),
                     e.item.data(),
                     (unsigned long long)(e.done / 1024));
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (complete) {
        std::fprintf(stderr, "\n");
        item_finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace espkit
