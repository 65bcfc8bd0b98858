#pragma once

#include <string>
#include "strmatch/types.hpp"

namespace strmatch {

/**
 * Gate every run through this check.
 *
 * Throws InvalidInputError when the text or pattern is empty, the pattern is
 * longer than the text, or the text exceeds MAX_TEXT_LEN characters.
 */
MatchRequest validate(std::string text, std::string pattern);

} // namespace strmatch
