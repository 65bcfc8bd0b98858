// =============================================================================
// Rabin-Karp Matcher Tests
// =============================================================================

#include <gtest/gtest.h>
#include "strmatch/rabin_karp.hpp"
#include "strmatch/naive_matcher.hpp"
#include "strmatch/validator.hpp"
#include "strmatch/error.hpp"
#include "strmatch/logging.hpp"
#include <algorithm>
#include <random>
#include <string>
#include <variant>
#include <vector>

using namespace strmatch;

class RabinKarpTest : public ::testing::Test {
protected:
    // Degenerate base/modulus pairs warn on every run
    void SetUp() override { set_log_level(LogLevel::ERROR); }
    void TearDown() override { set_log_level(LogLevel::INFO); }

    // Every ROLL step must carry the from-scratch hash of the window it rolled into
    static void expect_rolls_match_rehash(const MatchRequest& req, const MatchResult& result,
                                          uint64_t base, uint64_t modulus) {
        const std::string& text = req.text();
        const size_t m = req.pattern_length();
        for (const auto& step : result.trace) {
            if (step.phase() != Phase::ROLL) continue;
            const auto& roll = std::get<RollStep>(step.payload);
            uint64_t expected = hash_window(std::string_view(text).substr(roll.position + 1, m),
                                            base, modulus);
            EXPECT_EQ(roll.text_window_hash, expected) << "roll after offset " << roll.position;
        }
    }

    static std::vector<size_t> comparison_counts(const MatchResult& result) {
        std::vector<size_t> counts;
        for (const auto& step : result.trace) counts.push_back(step.comparison_count());
        return counts;
    }
};

TEST_F(RabinKarpTest, ModPow) {
    EXPECT_EQ(mod_pow(256, 0, 101), 1u);
    EXPECT_EQ(mod_pow(256, 1, 101), 54u);
    EXPECT_EQ(mod_pow(256, 8, 101), 79u);
    EXPECT_EQ(mod_pow(2, 10, 1000), 24u);
    EXPECT_EQ(mod_pow(5, 3, 2), 1u);
}

TEST_F(RabinKarpTest, HashWindowFoldsBytes) {
    EXPECT_EQ(hash_window("ABABCABAB", 256, 101), 88u);
    EXPECT_EQ(hash_window("ABABDABAC", 256, 101), 56u);
    EXPECT_EQ(hash_window("A", 256, 101), 65u);
}

TEST_F(RabinKarpTest, FindsSingleOccurrence) {
    auto req = validate("ABABDABACDABABCABAB", "ABABCABAB");
    auto result = run_rabin_karp(req);
    EXPECT_EQ(result.match_positions, (std::vector<size_t>{10}));
}

TEST_F(RabinKarpTest, FindsOverlappingOccurrences) {
    auto result = run_rabin_karp(validate("AAAA", "AA"));
    EXPECT_EQ(result.match_positions, (std::vector<size_t>{0, 1, 2}));
}

TEST_F(RabinKarpTest, NoMatchSkipsComparisons) {
    auto result = run_rabin_karp(validate("ABC", "XYZ"));
    EXPECT_TRUE(result.match_positions.empty());
    ASSERT_EQ(result.trace.size(), 2u);
    EXPECT_EQ(result.trace[1].comparison_count(), 0u);
    EXPECT_EQ(result.trace[1].detail_lines, (std::vector<std::string>{"Hash mismatch: 15 vs 59"}));
}

TEST_F(RabinKarpTest, InitStepRecordsHashes) {
    auto result = run_rabin_karp(validate("ABABDABACDABABCABAB", "ABABCABAB"));
    ASSERT_FALSE(result.trace.empty());
    const auto& init_step = result.trace.front();
    ASSERT_EQ(init_step.phase(), Phase::INIT);
    const auto& init = std::get<InitStep>(init_step.payload);
    EXPECT_EQ(init.pattern_hash, 88u);
    EXPECT_EQ(init.text_window_hash, 56u);
    EXPECT_EQ(init.high_order_factor, 79u);
    EXPECT_FALSE(init_step.position().has_value());
    EXPECT_EQ(init_step.comparison_count(), 0u);
    EXPECT_EQ(init_step.detail_lines,
              (std::vector<std::string>{"initial p_hash=88, t_hash=56, h=79"}));
}

TEST_F(RabinKarpTest, TraceShapeIsInitThenCheckRollPairs) {
    auto req = validate("ABABDABACDABABCABAB", "ABABCABAB");
    auto result = run_rabin_karp(req);
    const size_t offsets = req.last_offset() + 1;
    ASSERT_EQ(result.trace.size(), 1 + offsets + (offsets - 1));

    EXPECT_EQ(result.trace[0].phase(), Phase::INIT);
    for (size_t i = 0; i < offsets; ++i) {
        const auto& check = result.trace[1 + 2 * i];
        EXPECT_EQ(check.phase(), Phase::CHECK);
        EXPECT_EQ(*check.position(), i);
        if (i + 1 < offsets) {
            const auto& roll = result.trace[2 + 2 * i];
            EXPECT_EQ(roll.phase(), Phase::ROLL);
            EXPECT_EQ(*roll.position(), i);
            EXPECT_EQ(roll.comparison_count(), 0u);
            EXPECT_FALSE(roll.matched());
        }
    }
    EXPECT_EQ(result.trace.back().phase(), Phase::CHECK);
}

// Offset 6 hashes to 88 like the pattern but differs on the first character
TEST_F(RabinKarpTest, SpuriousHitIsRejected) {
    auto result = run_rabin_karp(validate("ABABDABACDABABCABAB", "ABABCABAB"));
    const auto& step = result.trace[1 + 2 * 6];
    const auto& check = std::get<HashCheckStep>(step.payload);
    EXPECT_EQ(check.position, 6u);
    EXPECT_EQ(check.pattern_hash, check.text_window_hash);
    EXPECT_FALSE(check.matched);
    EXPECT_EQ(check.comparison_count, 1u);
    EXPECT_EQ(step.detail_lines, (std::vector<std::string>{"t[6]='B' != p[0]='A'"}));
}

TEST_F(RabinKarpTest, RollStepsMatchRehash) {
    auto req = validate("ABABDABACDABABCABAB", "ABABCABAB");
    auto result = run_rabin_karp(req);
    expect_rolls_match_rehash(req, result, 256, 101);

    const auto& last_roll = result.trace[result.trace.size() - 2];
    EXPECT_EQ(last_roll.detail_lines, (std::vector<std::string>{"rolled t_hash -> 88"}));
}

TEST_F(RabinKarpTest, TinyModulusCollidesButNeverFalsePositive) {
    auto req = validate("ABCDEFGH", "CDX");
    auto result = run_rabin_karp(req, 256, 2);
    EXPECT_TRUE(result.match_positions.empty());
    // pattern hash 0 collides with windows at offsets 1, 3, 5
    std::vector<size_t> checks;
    for (const auto& step : result.trace) {
        if (step.phase() == Phase::CHECK) checks.push_back(step.comparison_count());
    }
    EXPECT_EQ(checks, (std::vector<size_t>{0, 1, 0, 1, 0, 1}));
    expect_rolls_match_rehash(req, result, 256, 2);
}

TEST_F(RabinKarpTest, BaseMultipleOfModulusStillCorrect) {
    auto req = validate("xaxbxa", "xa");
    auto result = run_rabin_karp(req, 202, 101);
    EXPECT_EQ(result.match_positions, (std::vector<size_t>{0, 4}));
    expect_rolls_match_rehash(req, result, 202, 101);
}

TEST_F(RabinKarpTest, ParamsOverload) {
    auto req = validate("banana", "ana");
    RabinKarpParams params;
    params.base = 31;
    params.modulus = 1000003;
    auto result = run_rabin_karp(req, params);
    EXPECT_EQ(result.match_positions, (std::vector<size_t>{1, 3}));
    // Distinct hashes under a large modulus: only true hits are verified
    EXPECT_EQ(result.trace[1 + 2 * 1].comparison_count(), 3u);
    EXPECT_EQ(result.trace[1 + 2 * 0].comparison_count(), 0u);
}

TEST_F(RabinKarpTest, RejectsInvalidParameters) {
    auto req = validate("banana", "ana");
    EXPECT_THROW(run_rabin_karp(req, 0, 101), InvalidArgumentError);
    EXPECT_THROW(run_rabin_karp(req, 256, 0), InvalidArgumentError);
    EXPECT_THROW(run_rabin_karp(req, 256, 1), InvalidArgumentError);
    EXPECT_THROW(run_rabin_karp(req, 256, MAX_RK_MODULUS + 1), InvalidArgumentError);
    EXPECT_NO_THROW(run_rabin_karp(req, 256, MAX_RK_MODULUS));
}

TEST_F(RabinKarpTest, HighBytesHashAsUnsigned) {
    std::string text = "\xff\xfe\xff\xfe";
    std::string pattern = "\xfe\xff";
    auto req = validate(text, pattern);
    auto result = run_rabin_karp(req);
    EXPECT_EQ(result.match_positions, (std::vector<size_t>{1}));
    expect_rolls_match_rehash(req, result, 256, 101);
    const auto& init = std::get<InitStep>(result.trace[0].payload);
    EXPECT_EQ(init.pattern_hash, (254u * 256u + 255u) % 101u);
}

TEST_F(RabinKarpTest, RerunIsDeterministic) {
    auto req = validate("mississippi river mississippi", "issi");
    auto first = run_rabin_karp(req);
    auto second = run_rabin_karp(req);
    EXPECT_EQ(first.match_positions, second.match_positions);
    EXPECT_EQ(comparison_counts(first), comparison_counts(second));
}

// Randomized agreement with the naive scan across moduli prone to collisions
TEST_F(RabinKarpTest, AgreesWithNaiveOnRandomInputs) {
    std::mt19937 rng(12345);
    const std::vector<uint64_t> moduli = {2, 3, 7, 101, 1000003, 2147483647};
    const std::vector<uint64_t> bases = {256, 31, 2};
    const std::string alphabet = "ab";

    for (int trial = 0; trial < 200; ++trial) {
        std::uniform_int_distribution<size_t> text_len(1, 60);
        size_t n = text_len(rng);
        std::uniform_int_distribution<size_t> pat_len(1, std::min<size_t>(n, 5));
        size_t m = pat_len(rng);

        std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
        std::string text, pattern;
        for (size_t i = 0; i < n; ++i) text += alphabet[pick(rng)];
        for (size_t i = 0; i < m; ++i) pattern += alphabet[pick(rng)];

        auto req = validate(text, pattern);
        auto naive = run_naive(req);
        uint64_t modulus = moduli[trial % moduli.size()];
        uint64_t base = bases[trial % bases.size()];
        auto rk = run_rabin_karp(req, base, modulus);

        ASSERT_EQ(rk.match_positions, naive.match_positions)
            << "text=" << text << " pattern=" << pattern << " base=" << base << " q=" << modulus;
        ASSERT_EQ(rk.trace.size(), 2 * (n - m) + 2);
        ASSERT_EQ(naive.trace.size(), n - m + 1);

        for (size_t k = 1; k < naive.match_positions.size(); ++k) {
            EXPECT_LT(naive.match_positions[k - 1], naive.match_positions[k]);
        }
        for (size_t p : rk.match_positions) {
            EXPECT_LE(p, n - m);
        }
        expect_rolls_match_rehash(req, rk, base, modulus);
    }
}
