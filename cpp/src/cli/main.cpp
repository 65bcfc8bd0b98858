// =============================================================================
// strmatch CLI - Naive vs Rabin-Karp substring search explorer
// =============================================================================
//
// Usage:
//   strmatch [global options] <command> [options] [<text> <pattern>]
//
// Commands:
//   run         Run both algorithms and print the side-by-side report
//   naive       Run the naive matcher only
//   rk          Run the Rabin-Karp matcher only
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   strmatch run ABABDABACDABABCABAB ABABCABAB
//   strmatch run --details --max-detail-steps 20 AAAA AA
//   strmatch rk --base 31 --modulus 1000003 --text-file book.txt --pattern-file word.txt
//
// =============================================================================

#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "strmatch/comparison.hpp"
#include "strmatch/config.hpp"
#include "strmatch/error.hpp"
#include "strmatch/logging.hpp"
#include "strmatch/naive_matcher.hpp"
#include "strmatch/rabin_karp.hpp"
#include "strmatch/report.hpp"
#include "strmatch/summary.hpp"
#include "strmatch/validator.hpp"

namespace strmatch::cli {
    int cmd_run(int argc, char* argv[]);
    int cmd_naive(int argc, char* argv[]);
    int cmd_rk(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define STRMATCH_VERSION_MAJOR 1
#define STRMATCH_VERSION_MINOR 0
#define STRMATCH_VERSION_PATCH 0
#define STRMATCH_VERSION_STRING "1.0.0"

// Defaults shown when no input is given
static const char* DEFAULT_TEXT = "ABABDABACDABABCABAB";
static const char* DEFAULT_PATTERN = "ABABCABAB";

static constexpr int EXIT_FAILED = 1;
static constexpr int EXIT_USAGE = 2;

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"run",     "Run both algorithms and compare them", strmatch::cli::cmd_run},
    {"naive",   "Run the naive matcher only", strmatch::cli::cmd_naive},
    {"rk",      "Run the Rabin-Karp matcher only", strmatch::cli::cmd_rk},
    {"version", "Show version information", strmatch::cli::cmd_version},
    {"help",    "Show this help message", strmatch::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "strmatch.env";
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

// Thrown for malformed command lines; mapped to EXIT_USAGE.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Command Options
// =============================================================================

struct RunOptions {
    std::string text;
    std::string pattern;
    bool have_text = false;
    bool have_pattern = false;
    strmatch::RabinKarpParams params;
    bool parallel = false;
    strmatch::ReportOptions report;
};

static std::string read_all_trim(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw strmatch::IOError("Failed to open " + path, __func__, "Check the path and permissions");
    }
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

static uint64_t parse_unsigned(const std::string& flag, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw UsageError(flag + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        size_t used = 0;
        uint64_t v = std::stoull(value, &used);
        if (used != value.size()) {
            throw UsageError(flag + " expects a non-negative integer, got '" + value + "'");
        }
        return v;
    } catch (const std::logic_error&) {
        throw UsageError(flag + " expects a non-negative integer, got '" + value + "'");
    }
}

// Config supplies defaults; flags override.
static RunOptions parse_run_options(int argc, char* argv[]) {
    auto& config = strmatch::Config::getInstance();

    RunOptions opts;
    opts.params.base = config.get<uint64_t>("rk.base", strmatch::DEFAULT_RK_BASE);
    opts.params.modulus = config.get<uint64_t>("rk.modulus", strmatch::DEFAULT_RK_MODULUS);
    opts.parallel = config.get<bool>("run.parallel", false);
    opts.report.max_detail_steps =
        static_cast<size_t>(config.get<int>("report.max_detail_steps", 60));

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw UsageError(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--text-file") {
            opts.text = read_all_trim(next());
            opts.have_text = true;
        } else if (arg == "--pattern-file") {
            opts.pattern = read_all_trim(next());
            opts.have_pattern = true;
        } else if (arg == "--base") {
            opts.params.base = parse_unsigned(arg, next());
        } else if (arg == "--modulus") {
            opts.params.modulus = parse_unsigned(arg, next());
        } else if (arg == "--max-detail-steps") {
            opts.report.max_detail_steps = static_cast<size_t>(parse_unsigned(arg, next()));
        } else if (arg == "--details") {
            opts.report.show_details = true;
        } else if (arg == "--parallel") {
            opts.parallel = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else if (!opts.have_text) {
            opts.text = arg;
            opts.have_text = true;
        } else if (!opts.have_pattern) {
            opts.pattern = arg;
            opts.have_pattern = true;
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
    }

    if (!opts.have_text && !opts.have_pattern) {
        opts.text = DEFAULT_TEXT;
        opts.pattern = DEFAULT_PATTERN;
        if (!g_options.quiet) {
            LOG_INFO("No input given, using the sample text and pattern");
        }
    } else if (!opts.have_pattern) {
        throw UsageError("Missing pattern");
    }
    return opts;
}

static void print_single(const strmatch::MatchRequest& request, strmatch::Algorithm algorithm,
                         strmatch::MatchResult result, const strmatch::ReportOptions& report) {
    strmatch::AlgorithmRun run{algorithm, std::move(result), {}};
    run.summary = strmatch::summarize(run.result);

    std::cout << "Text length (n):    " << request.text_length() << "\n"
              << "Pattern length (m): " << request.pattern_length() << "\n"
              << "Matches:            " << strmatch::format_positions(run.summary.match_positions) << "\n";
    strmatch::write_step_table(std::cout, run);
    if (report.show_details) {
        size_t cap = algorithm == strmatch::Algorithm::RABIN_KARP
            ? report.max_detail_steps : std::numeric_limits<size_t>::max();
        strmatch::write_details(std::cout, run, cap);
    }
    std::cout << "\nTotal time: " << run.summary.total_elapsed_seconds << "s, comparisons: "
              << run.summary.total_comparisons << "\n";
}

// =============================================================================
// Commands
// =============================================================================

namespace strmatch::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "strmatch - Naive vs Rabin-Karp substring search explorer\n";
    std::cout << "Version " << STRMATCH_VERSION_STRING << "\n\n";
    std::cout << "Usage: strmatch [global options] <command> [options] [<text> <pattern>]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Config file (default: strmatch.env)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only log errors\n";
    std::cout << "\nCommand Options:\n";
    std::cout << "  --text-file <file>      Read the text from a file\n";
    std::cout << "  --pattern-file <file>   Read the pattern from a file\n";
    std::cout << "  --base <n>              Rabin-Karp base (default: 256)\n";
    std::cout << "  --modulus <n>           Rabin-Karp modulus (default: 101)\n";
    std::cout << "  --parallel              Run both algorithms concurrently (run only)\n";
    std::cout << "  --details               Print per-step detail lines\n";
    std::cout << "  --max-detail-steps <n>  Cap on Rabin-Karp detail steps (default: 60)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  SM_RK_BASE, SM_RK_MODULUS, SM_PARALLEL, SM_MAX_DETAIL_STEPS,\n";
    std::cout << "  SM_LOG_LEVEL, SM_LOG_FILE\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "strmatch " << STRMATCH_VERSION_STRING << "\n";
    std::cout << "Max text length: " << MAX_TEXT_LEN << "\n";
    return 0;
}

int cmd_run(int argc, char* argv[]) {
    RunOptions opts = parse_run_options(argc, argv);
    MatchRequest request = validate(std::move(opts.text), std::move(opts.pattern));

    ComparisonOptions options;
    options.rabin_karp = opts.params;
    options.parallel = opts.parallel;

    Comparison comparison = run_comparison(request, options);
    write_report(std::cout, request, comparison, opts.report);
    return comparison.agree ? 0 : EXIT_FAILED;
}

int cmd_naive(int argc, char* argv[]) {
    RunOptions opts = parse_run_options(argc, argv);
    MatchRequest request = validate(std::move(opts.text), std::move(opts.pattern));
    print_single(request, Algorithm::NAIVE, run_naive(request), opts.report);
    return 0;
}

int cmd_rk(int argc, char* argv[]) {
    RunOptions opts = parse_run_options(argc, argv);
    MatchRequest request = validate(std::move(opts.text), std::move(opts.pattern));
    print_single(request, Algorithm::RABIN_KARP,
                 run_rabin_karp(request, opts.params), opts.report);
    return 0;
}

} // namespace strmatch::cli

// =============================================================================
// Main
// =============================================================================

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!strmatch::init_config(g_options.config_file)) {
        for (const auto& error : strmatch::Config::getInstance().errors()) {
            std::cerr << "Config error: " << error << "\n";
        }
        return EXIT_FAILED;
    }
    if (g_options.verbose) {
        strmatch::set_log_level(strmatch::LogLevel::DEBUG);
        strmatch::Config::getInstance().print();
    }
    if (g_options.quiet) strmatch::set_log_level(strmatch::LogLevel::ERROR);

    if (argc < 1) {
        strmatch::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const UsageError& e) {
                std::cerr << "Usage error: " << e.what() << "\n";
                std::cerr << "Run 'strmatch help' for usage.\n";
                return EXIT_USAGE;
            } catch (const strmatch::InvalidInputError& e) {
                std::cerr << "Error: " << e.reason() << "\n";
                return EXIT_FAILED;
            } catch (const strmatch::StrmatchException& e) {
                std::cerr << e.what() << "\n";
                return EXIT_FAILED;
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return EXIT_FAILED;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'strmatch help' for usage.\n";
    return EXIT_USAGE;
}
