#include "strmatch/report.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace strmatch {

namespace {

constexpr int INDEX_WIDTH = 8;
constexpr int PHASE_WIDTH = 7;
constexpr int FLAG_WIDTH = 9;
constexpr int COUNT_WIDTH = 13;
constexpr int TIME_WIDTH = 12;
constexpr int MEMORY_WIDTH = 10;

void write_section(std::ostream& os, const std::string& title) {
    os << "\n== " << title << " " << std::string(title.size() < 60 ? 60 - title.size() : 0, '=') << "\n";
}

std::string index_label(const StepRecord& step) {
    auto pos = step.position();
    return pos ? std::to_string(*pos) : "-";
}

std::string format_seconds(double seconds) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(6) << seconds;
    return os.str();
}

std::string format_percent(double share) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << share * 100.0 << "%";
    return os.str();
}

// Restores the caller's flags, precision and fill on scope exit.
class StreamStateGuard {
public:
    explicit StreamStateGuard(std::ostream& os)
        : os_(os), flags_(os.flags()), precision_(os.precision()), fill_(os.fill()) {}

    ~StreamStateGuard() {
        os_.flags(flags_);
        os_.precision(precision_);
        os_.fill(fill_);
    }

    StreamStateGuard(const StreamStateGuard&) = delete;
    StreamStateGuard& operator=(const StreamStateGuard&) = delete;

private:
    std::ostream& os_;
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
    char fill_;
};

} // anonymous namespace

std::string format_positions(const std::vector<size_t>& positions) {
    if (positions.empty()) {
        return "None";
    }
    std::ostringstream os;
    os << "[";
    for (size_t i = 0; i < positions.size(); ++i) {
        if (i > 0) os << ", ";
        os << positions[i];
    }
    os << "]";
    return os.str();
}

void write_overview(std::ostream& os, const MatchRequest& request, const Comparison& comparison) {
    write_section(os, "Summary Overview");
    os << "Text length (n):     " << request.text_length() << "\n"
       << "Pattern length (m):  " << request.pattern_length() << "\n"
       << "Naive matches:       " << format_positions(comparison.naive.summary.match_positions) << "\n"
       << "Rabin-Karp matches:  " << format_positions(comparison.rabin_karp.summary.match_positions) << "\n"
       << "Results agree:       " << (comparison.agree ? "yes" : "NO") << "\n";
}

void write_step_table(std::ostream& os, const AlgorithmRun& run) {
    StreamStateGuard guard(os);
    const bool with_phase = run.algorithm == Algorithm::RABIN_KARP;

    write_section(os, std::string(algorithm_name(run.algorithm)) + " Algorithm");
    os << std::left << std::setw(INDEX_WIDTH) << "index";
    if (with_phase) os << std::setw(PHASE_WIDTH) << "phase";
    os << std::setw(FLAG_WIDTH) << "matched"
       << std::right << std::setw(COUNT_WIDTH) << "comparisons"
       << std::setw(TIME_WIDTH) << "time_s"
       << std::setw(MEMORY_WIDTH) << "memory_b" << "\n";

    for (const auto& step : run.result.trace) {
        os << std::left << std::setw(INDEX_WIDTH) << index_label(step);
        if (with_phase) os << std::setw(PHASE_WIDTH) << phase_name(step.phase());
        os << std::setw(FLAG_WIDTH) << (step.matched() ? "true" : "false")
           << std::right << std::setw(COUNT_WIDTH) << step.comparison_count()
           << std::setw(TIME_WIDTH) << format_seconds(step.elapsed_seconds)
           << std::setw(MEMORY_WIDTH) << step.memory_estimate_bytes << "\n";
    }
}

void write_details(std::ostream& os, const AlgorithmRun& run, size_t max_steps) {
    const auto& trace = run.result.trace;
    const size_t shown = std::min(max_steps, trace.size());

    write_section(os, std::string("Detailed Iterations (") + algorithm_name(run.algorithm) + ")");
    for (size_t i = 0; i < shown; ++i) {
        const auto& step = trace[i];
        os << "Index " << index_label(step)
           << " | phase: " << phase_name(step.phase())
           << " | matched: " << (step.matched() ? "true" : "false")
           << " | time: " << format_seconds(step.elapsed_seconds) << "s"
           << " | mem: " << step.memory_estimate_bytes << " bytes\n";
        for (const auto& line : step.detail_lines) {
            os << "    " << line << "\n";
        }
    }
    if (shown < trace.size()) {
        os << "... " << (trace.size() - shown) << " more steps not shown\n";
    }
}

void write_totals(std::ostream& os, const Comparison& comparison) {
    StreamStateGuard guard(os);
    write_section(os, "Totals");
    for (const AlgorithmRun* run : {&comparison.naive, &comparison.rabin_karp}) {
        os << std::left << std::setw(12) << algorithm_name(run->algorithm)
           << " time: " << format_seconds(run->summary.total_elapsed_seconds) << "s"
           << "  comparisons: " << run->summary.total_comparisons
           << "  steps: " << run->result.trace.size() << "\n";
    }
    os << "Runtime share: naive " << format_percent(comparison.naive_time_share)
       << ", Rabin-Karp " << format_percent(comparison.rabin_karp_time_share) << "\n";
}

void write_report(std::ostream& os, const MatchRequest& request, const Comparison& comparison,
                  const ReportOptions& options) {
    write_overview(os, request, comparison);

    write_step_table(os, comparison.naive);
    if (options.show_details) {
        write_details(os, comparison.naive, std::numeric_limits<size_t>::max());
    }

    write_step_table(os, comparison.rabin_karp);
    if (options.show_details) {
        write_details(os, comparison.rabin_karp, options.max_detail_steps);
    }

    write_totals(os, comparison);
}

} // namespace strmatch
