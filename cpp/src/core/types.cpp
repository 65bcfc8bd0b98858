#include "strmatch/types.hpp"

#include <type_traits>

namespace strmatch {

namespace {

template<typename T>
constexpr bool is_check_v = std::is_same_v<T, CheckStep> || std::is_same_v<T, HashCheckStep>;

} // anonymous namespace

const char* phase_name(Phase phase) noexcept {
    switch (phase) {
        case Phase::INIT:  return "init";
        case Phase::CHECK: return "check";
        case Phase::ROLL:  return "roll";
    }
    return "unknown";
}

Phase StepRecord::phase() const noexcept {
    return std::visit([](const auto& step) {
        using T = std::decay_t<decltype(step)>;
        if constexpr (std::is_same_v<T, InitStep>) {
            return Phase::INIT;
        } else if constexpr (std::is_same_v<T, RollStep>) {
            return Phase::ROLL;
        } else {
            return Phase::CHECK;
        }
    }, payload);
}

size_t StepRecord::comparison_count() const noexcept {
    return std::visit([](const auto& step) -> size_t {
        using T = std::decay_t<decltype(step)>;
        if constexpr (is_check_v<T>) {
            return step.comparison_count;
        } else {
            return 0;
        }
    }, payload);
}

bool StepRecord::matched() const noexcept {
    return std::visit([](const auto& step) {
        using T = std::decay_t<decltype(step)>;
        if constexpr (is_check_v<T>) {
            return step.matched;
        } else {
            return false;
        }
    }, payload);
}

std::optional<size_t> StepRecord::position() const noexcept {
    return std::visit([](const auto& step) -> std::optional<size_t> {
        using T = std::decay_t<decltype(step)>;
        if constexpr (std::is_same_v<T, InitStep>) {
            return std::nullopt;
        } else {
            return step.position;
        }
    }, payload);
}

std::optional<uint64_t> StepRecord::text_window_hash() const noexcept {
    return std::visit([](const auto& step) -> std::optional<uint64_t> {
        using T = std::decay_t<decltype(step)>;
        if constexpr (std::is_same_v<T, CheckStep>) {
            return std::nullopt;
        } else {
            return step.text_window_hash;
        }
    }, payload);
}

std::optional<uint64_t> StepRecord::pattern_hash() const noexcept {
    return std::visit([](const auto& step) -> std::optional<uint64_t> {
        using T = std::decay_t<decltype(step)>;
        if constexpr (std::is_same_v<T, CheckStep>) {
            return std::nullopt;
        } else {
            return step.pattern_hash;
        }
    }, payload);
}

} // namespace strmatch
