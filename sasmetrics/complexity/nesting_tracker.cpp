#include "complexity/nesting_tracker.hpp"
#include <spdlog/spdlog.h>

namespace sasmetrics::complexity {

void NestingTracker::open_block() {
    ++depth_;
    if (depth_ > max_depth_) {
        max_depth_ = depth_;
    }
    spdlog::debug("Opened block, depth {}", depth_);
}

bool NestingTracker::close_block() {
    if (depth_ == 0) {
        spdlog::debug("Ignoring block close with no open block");
        return false;
    }
    --depth_;
    spdlog::debug("Closed block, depth {}", depth_);
    return true;
}

} // namespace sasmetrics::complexity
