#include "strmatch/validator.hpp"
#include "strmatch/error.hpp"
#include "strmatch/logging.hpp"

namespace strmatch {

MatchRequest validate(std::string text, std::string pattern) {
    STRMATCH_CHECK_INPUT(!text.empty(), "Text cannot be empty.",
                         "Provide at least one character of text");
    STRMATCH_CHECK_INPUT(!pattern.empty(), "Pattern cannot be empty.",
                         "Provide at least one character of pattern");
    STRMATCH_CHECK_INPUT(pattern.size() <= text.size(),
                         "Pattern cannot be longer than text.",
                         "Pattern has " + std::to_string(pattern.size()) +
                         " characters, text has " + std::to_string(text.size()));
    STRMATCH_CHECK_INPUT(text.size() <= MAX_TEXT_LEN,
                         "Text too large (max " + std::to_string(MAX_TEXT_LEN) + " chars).",
                         "Text has " + std::to_string(text.size()) + " characters");

    LOG_DEBUG("Validated request: n=", text.size(), " m=", pattern.size());
    return MatchRequest(std::move(text), std::move(pattern));
}

} // namespace strmatch
