#pragma once

#include "strmatch/rabin_karp.hpp"
#include "strmatch/types.hpp"

namespace strmatch {

enum class Algorithm {
    NAIVE,
    RABIN_KARP
};

const char* algorithm_name(Algorithm algorithm) noexcept;

struct ComparisonOptions {
    RabinKarpParams rabin_karp;
    bool parallel = false;  // run both matchers concurrently on the shared request
};

struct AlgorithmRun {
    Algorithm algorithm;
    MatchResult result;
    RunSummary summary;
};

/**
 * Both algorithms over one request, side by side.
 *
 * agree is true when the two reported identical match positions. The time
 * shares split the combined elapsed time between the two runs; both are 0
 * when nothing measurable elapsed.
 */
struct Comparison {
    AlgorithmRun naive;
    AlgorithmRun rabin_karp;
    bool agree = false;
    double naive_time_share = 0.0;
    double rabin_karp_time_share = 0.0;
};

Comparison run_comparison(const MatchRequest& request,
                          const ComparisonOptions& options = ComparisonOptions{});

} // namespace strmatch
