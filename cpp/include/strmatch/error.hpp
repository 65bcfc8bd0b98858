#pragma once

#include <stdexcept>
#include <string>

namespace strmatch {

/**
 * Structured error reporting for the matching engine.
 * Every error carries a code, the function it was raised from, and an
 * optional hint for the caller.
 */

enum class ErrorCode {
    SUCCESS = 0,

    // Input contract
    INVALID_INPUT = 1,
    INVALID_ARGUMENT = 2,

    // I/O errors
    FILE_NOT_FOUND = 300
};

class StrmatchException : public std::runtime_error {
public:
    explicit StrmatchException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , reason_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& reason() const noexcept { return reason_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "strmatch error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string reason_;
    std::string context_;
    std::string suggestion_;
};

// Rejected text/pattern pair. Raised only by validate().
class InvalidInputError : public StrmatchException {
public:
    explicit InvalidInputError(const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : StrmatchException(ErrorCode::INVALID_INPUT, message, context, suggestion) {}
};

class InvalidArgumentError : public StrmatchException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : StrmatchException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class IOError : public StrmatchException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : StrmatchException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_input(bool condition, const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "") {
        if (!condition) {
            throw InvalidInputError(message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

// Macros for common error checking
#define STRMATCH_CHECK_INPUT(condition, message, suggestion) \
    strmatch::ErrorHandler::check_input(condition, message, __func__, suggestion)

#define STRMATCH_CHECK_ARGUMENT(condition, message) \
    strmatch::ErrorHandler::check_argument(condition, message, __func__)

} // namespace strmatch
