#include "strmatch/naive_matcher.hpp"
#include "strmatch/logging.hpp"
#include "strmatch/timing.hpp"

#include <sstream>
#include <utility>

namespace strmatch {

namespace {

std::string describe(const std::string& text, const std::string& pattern,
                     size_t k, size_t j, bool equal, bool mark_stop) {
    std::ostringstream os;
    os << "t[" << k << "]='" << text[k] << "' " << (equal ? "==" : "!=")
       << " p[" << j << "]='" << pattern[j] << "'";
    if (!equal && mark_stop) {
        os << " (stop)";
    }
    return os.str();
}

} // anonymous namespace

WindowComparison compare_window(const std::string& text, const std::string& pattern,
                                size_t offset, bool mark_stop) {
    WindowComparison out;
    const size_t m = pattern.size();
    out.details.reserve(m);

    for (size_t j = 0; j < m; ++j) {
        const size_t k = offset + j;
        ++out.comparisons;
        const bool equal = text[k] == pattern[j];
        out.details.push_back(describe(text, pattern, k, j, equal, mark_stop));
        if (!equal) {
            out.matched = false;
            break;
        }
    }
    return out;
}

MatchResult run_naive(const MatchRequest& request) {
    const std::string& text = request.text();
    const std::string& pattern = request.pattern();
    const size_t last = request.last_offset();
    const size_t memory = request.memory_estimate_bytes();

    MatchResult result;
    result.trace.reserve(last + 1);

    for (size_t i = 0; i <= last; ++i) {
        auto timed = time_call([&] { return compare_window(text, pattern, i, true); });
        WindowComparison& cmp = timed.value;

        if (cmp.matched) {
            result.match_positions.push_back(i);
        }

        StepRecord step;
        step.payload = CheckStep{i, cmp.matched, cmp.comparisons};
        step.elapsed_seconds = timed.elapsed_seconds;
        step.memory_estimate_bytes = memory;
        step.detail_lines = std::move(cmp.details);
        result.trace.push_back(std::move(step));
    }

    LOG_DEBUG("Naive scan finished: n=", request.text_length(), " m=", request.pattern_length(),
              " offsets=", result.trace.size(), " matches=", result.match_positions.size());
    return result;
}

} // namespace strmatch
