#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include "strmatch/comparison.hpp"

namespace strmatch {

struct ReportOptions {
    bool show_details = false;
    size_t max_detail_steps = 60;  // Rabin-Karp detail listing cap
};

// "[0, 1, 2]" or "None" for an empty list.
std::string format_positions(const std::vector<size_t>& positions);

void write_overview(std::ostream& os, const MatchRequest& request, const Comparison& comparison);

// One row per step: index, phase (Rabin-Karp only), matched, comparisons, time, memory.
void write_step_table(std::ostream& os, const AlgorithmRun& run);

// Header plus detail lines for at most max_steps steps.
void write_details(std::ostream& os, const AlgorithmRun& run, size_t max_steps);

void write_totals(std::ostream& os, const Comparison& comparison);

void write_report(std::ostream& os, const MatchRequest& request, const Comparison& comparison,
                  const ReportOptions& options = ReportOptions{});

} // namespace strmatch
