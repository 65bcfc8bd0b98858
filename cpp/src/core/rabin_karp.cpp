#include "strmatch/rabin_karp.hpp"
#include "strmatch/naive_matcher.hpp"
#include "strmatch/error.hpp"
#include "strmatch/logging.hpp"
#include "strmatch/timing.hpp"

#include <sstream>
#include <utility>

namespace strmatch {

void check_hash_parameters(uint64_t base, uint64_t modulus) {
    STRMATCH_CHECK_ARGUMENT(base >= 1, "Rabin-Karp base must be at least 1");
    STRMATCH_CHECK_ARGUMENT(modulus >= 2 && modulus <= MAX_RK_MODULUS,
                            "Rabin-Karp modulus must be in [2, 2^31], got " + std::to_string(modulus));
}

uint64_t mod_pow(uint64_t base, uint64_t exp, uint64_t modulus) noexcept {
    uint64_t result = 1 % modulus;
    uint64_t x = base % modulus;
    while (exp > 0) {
        if (exp & 1ULL) {
            result = (result * x) % modulus;
        }
        x = (x * x) % modulus;
        exp >>= 1;
    }
    return result;
}

uint64_t hash_window(std::string_view window, uint64_t base, uint64_t modulus) noexcept {
    const uint64_t b = base % modulus;
    uint64_t hash = 0;
    for (char c : window) {
        hash = (b * hash + static_cast<unsigned char>(c)) % modulus;
    }
    return hash;
}

uint64_t roll_hash(uint64_t hash, unsigned char outgoing, unsigned char incoming,
                   uint64_t high_order, uint64_t base, uint64_t modulus) noexcept {
    const uint64_t lead = (outgoing % modulus) * high_order % modulus;
    const uint64_t rest = (hash + modulus - lead) % modulus;
    return (rest * (base % modulus) + incoming) % modulus;
}

MatchResult run_rabin_karp(const MatchRequest& request, uint64_t base, uint64_t modulus) {
    check_hash_parameters(base, modulus);
    if (base % modulus == 0) {
        LOG_WARN("Base ", base, " is a multiple of modulus ", modulus,
                 "; every window hashes to its last character");
    }

    const std::string& text = request.text();
    const std::string& pattern = request.pattern();
    const size_t m = request.pattern_length();
    const size_t last = request.last_offset();
    const size_t memory = request.memory_estimate_bytes();

    MatchResult result;
    result.trace.reserve(2 * last + 2);

    const uint64_t h = mod_pow(base, m - 1, modulus);

    auto init = time_call([&] {
        return std::make_pair(hash_window(pattern, base, modulus),
                              hash_window(std::string_view(text).substr(0, m), base, modulus));
    });
    const uint64_t p_hash = init.value.first;
    uint64_t t_hash = init.value.second;

    {
        StepRecord step;
        step.payload = InitStep{p_hash, t_hash, h};
        step.elapsed_seconds = init.elapsed_seconds;
        step.memory_estimate_bytes = memory;
        std::ostringstream os;
        os << "initial p_hash=" << p_hash << ", t_hash=" << t_hash << ", h=" << h;
        step.detail_lines.push_back(os.str());
        result.trace.push_back(std::move(step));
    }

    size_t collisions = 0;
    for (size_t i = 0; i <= last; ++i) {
        auto check = time_call([&] {
            WindowComparison cmp;
            if (p_hash == t_hash) {
                cmp = compare_window(text, pattern, i, false);
            } else {
                cmp.matched = false;
                std::ostringstream os;
                os << "Hash mismatch: " << p_hash << " vs " << t_hash;
                cmp.details.push_back(os.str());
            }
            return cmp;
        });
        WindowComparison& cmp = check.value;

        if (cmp.matched) {
            result.match_positions.push_back(i);
        } else if (cmp.comparisons > 0) {
            ++collisions;
        }

        StepRecord step;
        step.payload = HashCheckStep{i, cmp.matched, cmp.comparisons, p_hash, t_hash};
        step.elapsed_seconds = check.elapsed_seconds;
        step.memory_estimate_bytes = memory;
        step.detail_lines = std::move(cmp.details);
        result.trace.push_back(std::move(step));

        if (i < last) {
            auto roll = time_call([&] {
                return roll_hash(t_hash,
                                 static_cast<unsigned char>(text[i]),
                                 static_cast<unsigned char>(text[i + m]),
                                 h, base, modulus);
            });
            t_hash = roll.value;

            StepRecord roll_step;
            roll_step.payload = RollStep{i, p_hash, t_hash};
            roll_step.elapsed_seconds = roll.elapsed_seconds;
            roll_step.memory_estimate_bytes = memory;
            roll_step.detail_lines.push_back("rolled t_hash -> " + std::to_string(t_hash));
            result.trace.push_back(std::move(roll_step));
        }
    }

    LOG_DEBUG("Rabin-Karp finished: n=", request.text_length(), " m=", m,
              " base=", base, " modulus=", modulus,
              " matches=", result.match_positions.size(), " collisions=", collisions);
    return result;
}

} // namespace strmatch
