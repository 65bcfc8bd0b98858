#pragma once

#include "strmatch/types.hpp"

namespace strmatch {

// Totals over a trace: summed step time, summed comparisons, copied positions.
RunSummary summarize(const MatchResult& result);

} // namespace strmatch
