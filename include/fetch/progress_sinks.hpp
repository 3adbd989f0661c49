#pragma once

#include "fetch/progress.hpp"

#include <cstdint>
#include <string>

namespace espkit {

// Single self-overwriting stderr line per item.
class ConsoleProgressSink final : public IProgress {
public:
    explicit ConsoleProgressSink(std::uint64_t min_step_bytes = 1024 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::uint64_t min_step_ = 0;
    std::uint64_t next_ = 0;
    std::string last_item_;
    bool item_finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace espkit
