#include "strmatch/comparison.hpp"
#include "strmatch/naive_matcher.hpp"
#include "strmatch/summary.hpp"
#include "strmatch/logging.hpp"

#include <future>
#include <utility>

namespace strmatch {

namespace {

AlgorithmRun make_run(Algorithm algorithm, MatchResult result) {
    AlgorithmRun run{algorithm, std::move(result), {}};
    run.summary = summarize(run.result);
    return run;
}

} // anonymous namespace

const char* algorithm_name(Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::NAIVE:      return "Naive";
        case Algorithm::RABIN_KARP: return "Rabin-Karp";
    }
    return "Unknown";
}

Comparison run_comparison(const MatchRequest& request, const ComparisonOptions& options) {
    // Reject bad hash parameters before any work starts
    check_hash_parameters(options.rabin_karp.base, options.rabin_karp.modulus);

    MatchResult naive_result;
    MatchResult rk_result;

    if (options.parallel) {
        // Both tasks only read the request; no synchronization needed beyond get()
        auto rk_future = std::async(std::launch::async, [&request, &options] {
            return run_rabin_karp(request, options.rabin_karp);
        });
        naive_result = run_naive(request);
        rk_result = rk_future.get();
    } else {
        naive_result = run_naive(request);
        rk_result = run_rabin_karp(request, options.rabin_karp);
    }

    Comparison cmp{
        make_run(Algorithm::NAIVE, std::move(naive_result)),
        make_run(Algorithm::RABIN_KARP, std::move(rk_result)),
    };

    cmp.agree = cmp.naive.summary.match_positions == cmp.rabin_karp.summary.match_positions;
    if (!cmp.agree) {
        LOG_ERROR("Algorithms disagree: naive found ", cmp.naive.summary.match_positions.size(),
                  " matches, Rabin-Karp found ", cmp.rabin_karp.summary.match_positions.size());
    }

    const double total = cmp.naive.summary.total_elapsed_seconds +
                         cmp.rabin_karp.summary.total_elapsed_seconds;
    if (total > 0.0) {
        cmp.naive_time_share = cmp.naive.summary.total_elapsed_seconds / total;
        cmp.rabin_karp_time_share = cmp.rabin_karp.summary.total_elapsed_seconds / total;
    }

    LOG_DEBUG("Comparison done (", options.parallel ? "parallel" : "sequential", "): naive ",
              cmp.naive.summary.total_comparisons, " comparisons, Rabin-Karp ",
              cmp.rabin_karp.summary.total_comparisons, " comparisons");
    return cmp;
}

} // namespace strmatch
