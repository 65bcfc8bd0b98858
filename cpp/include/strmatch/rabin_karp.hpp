#pragma once

#include <cstdint>
#include <string_view>
#include "strmatch/types.hpp"

namespace strmatch {

inline constexpr uint64_t DEFAULT_RK_BASE = 256;
inline constexpr uint64_t DEFAULT_RK_MODULUS = 101;

struct RabinKarpParams {
    uint64_t base = DEFAULT_RK_BASE;
    uint64_t modulus = DEFAULT_RK_MODULUS;
};

/**
 * Throws InvalidArgumentError unless base >= 1 and 2 <= modulus <= 2^31.
 * The modulus bound keeps every intermediate product inside 64 bits.
 */
void check_hash_parameters(uint64_t base, uint64_t modulus);

// base^exp mod modulus by square-and-multiply.
uint64_t mod_pow(uint64_t base, uint64_t exp, uint64_t modulus) noexcept;

// Polynomial hash of a window from scratch: h = (base*h + byte) mod modulus per character.
uint64_t hash_window(std::string_view window, uint64_t base, uint64_t modulus) noexcept;

/**
 * Advance a window hash by one character.
 *
 * high_order must be base^(m-1) mod modulus for window length m. The result is
 * the non-negative residue of base*(hash - outgoing*high_order) + incoming.
 */
uint64_t roll_hash(uint64_t hash, unsigned char outgoing, unsigned char incoming,
                   uint64_t high_order, uint64_t base, uint64_t modulus) noexcept;

/**
 * Rabin-Karp search with a full instrumentation trace.
 *
 * Emits one INIT step, then per offset a CHECK step and, except after the
 * final offset, a ROLL step. Equal hashes are always confirmed character by
 * character, so collisions never produce a match.
 */
MatchResult run_rabin_karp(const MatchRequest& request,
                           uint64_t base = DEFAULT_RK_BASE,
                           uint64_t modulus = DEFAULT_RK_MODULUS);

inline MatchResult run_rabin_karp(const MatchRequest& request, const RabinKarpParams& params) {
    return run_rabin_karp(request, params.base, params.modulus);
}

} // namespace strmatch
