#ifndef SASMETRICS_COMPLEXITY_NESTING_TRACKER_HPP
#define SASMETRICS_COMPLEXITY_NESTING_TRACKER_HPP

#pragma once

#include <cstddef>

namespace sasmetrics::complexity {

// Counts concurrently open blocks. One tracker per scanned unit.
class NestingTracker {
public:
    void open_block();

    // Returns false when there is nothing to close; depth stays at zero.
    bool close_block();

    size_t depth() const { return depth_; }
    size_t max_depth() const { return max_depth_; }

private:
    size_t depth_ {0};
    size_t max_depth_ {0};
};

} // namespace sasmetrics::complexity

#endif // SASMETRICS_COMPLEXITY_NESTING_TRACKER_HPP
