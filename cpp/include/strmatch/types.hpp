#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace strmatch {

// Largest text the engine accepts.
inline constexpr size_t MAX_TEXT_LEN = 20000;

// Upper bound on the Rabin-Karp modulus so that base*hash products stay in 64 bits.
inline constexpr uint64_t MAX_RK_MODULUS = 1ULL << 31;

// =============================================================================
// MatchRequest
// =============================================================================

/**
 * A validated text/pattern pair.
 *
 * Guaranteed 1 <= pattern.size() <= text.size() <= MAX_TEXT_LEN.
 * Only validate() can construct one, so every matcher may rely on the
 * invariant without re-checking it.
 */
class MatchRequest {
public:
    const std::string& text() const noexcept { return text_; }
    const std::string& pattern() const noexcept { return pattern_; }

    size_t text_length() const noexcept { return text_.size(); }
    size_t pattern_length() const noexcept { return pattern_.size(); }

    // Highest offset at which the pattern still fits (n - m).
    size_t last_offset() const noexcept { return text_.size() - pattern_.size(); }

    // Footprint of the two input strings. Says nothing about matcher working memory.
    size_t memory_estimate_bytes() const noexcept {
        return sizeof(std::string) * 2 + text_.size() + pattern_.size();
    }

private:
    MatchRequest(std::string text, std::string pattern)
        : text_(std::move(text)), pattern_(std::move(pattern)) {}

    friend MatchRequest validate(std::string text, std::string pattern);

    std::string text_;
    std::string pattern_;
};

// =============================================================================
// Trace steps
// =============================================================================

enum class Phase {
    INIT,   // initial hash computation (Rabin-Karp only)
    CHECK,  // one aligned offset examined
    ROLL    // window hash advanced by one character (Rabin-Karp only)
};

const char* phase_name(Phase phase) noexcept;

struct InitStep {
    uint64_t pattern_hash;
    uint64_t text_window_hash;
    uint64_t high_order_factor;  // base^(m-1) mod modulus
};

// Naive check of one offset.
struct CheckStep {
    size_t position;
    bool matched;
    size_t comparison_count;
};

// Rabin-Karp check of one offset; comparison_count is 0 when the hashes differ.
struct HashCheckStep {
    size_t position;
    bool matched;
    size_t comparison_count;
    uint64_t pattern_hash;
    uint64_t text_window_hash;
};

// text_window_hash is the hash of the window starting at position + 1.
struct RollStep {
    size_t position;
    uint64_t pattern_hash;
    uint64_t text_window_hash;
};

using StepPayload = std::variant<InitStep, CheckStep, HashCheckStep, RollStep>;

struct StepRecord {
    StepPayload payload;
    double elapsed_seconds = 0.0;
    size_t memory_estimate_bytes = 0;
    std::vector<std::string> detail_lines;  // display only

    Phase phase() const noexcept;
    size_t comparison_count() const noexcept;
    bool matched() const noexcept;

    // Text offset the step refers to; empty for INIT.
    std::optional<size_t> position() const noexcept;

    // Current window hash for Rabin-Karp steps; empty for naive steps.
    std::optional<uint64_t> text_window_hash() const noexcept;
    std::optional<uint64_t> pattern_hash() const noexcept;
};

// =============================================================================
// Results
// =============================================================================

struct MatchResult {
    std::vector<size_t> match_positions;  // strictly increasing
    std::vector<StepRecord> trace;        // emission order
};

struct RunSummary {
    double total_elapsed_seconds = 0.0;
    size_t total_comparisons = 0;
    std::vector<size_t> match_positions;
};

} // namespace strmatch
