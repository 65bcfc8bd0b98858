#pragma once

#include <string>
#include <vector>
#include "strmatch/types.hpp"

namespace strmatch {

// Outcome of comparing the pattern against one text window.
struct WindowComparison {
    bool matched = true;
    size_t comparisons = 0;
    std::vector<std::string> details;
};

/**
 * Compare pattern[j] with text[offset + j] for j = 0, 1, ... and stop at the
 * first mismatch. The mismatching character counts as a comparison.
 * One detail line is produced per character examined; mark_stop appends
 * " (stop)" to the mismatch line.
 *
 * Requires offset + pattern.size() <= text.size().
 */
WindowComparison compare_window(const std::string& text, const std::string& pattern,
                                size_t offset, bool mark_stop);

// Scan every offset 0..n-m in order and emit one CHECK step per offset.
MatchResult run_naive(const MatchRequest& request);

} // namespace strmatch
