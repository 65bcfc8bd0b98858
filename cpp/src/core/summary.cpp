#include "strmatch/summary.hpp"

namespace strmatch {

RunSummary summarize(const MatchResult& result) {
    RunSummary summary;
    for (const auto& step : result.trace) {
        summary.total_elapsed_seconds += step.elapsed_seconds;
        summary.total_comparisons += step.comparison_count();
    }
    summary.match_positions = result.match_positions;
    return summary;
}

} // namespace strmatch
