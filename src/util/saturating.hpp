#pragma once
#include <cstdint>
#include <limits>
#include <type_traits>

namespace helm::util {

// total += delta, clamped to T's range instead of overflowing
template <typename T, typename U>
void add_saturating(T& total, U delta) {
    static_assert(std::is_integral<T>::value && std::is_integral<U>::value,
                  "add_saturating needs integer counters");
    using Wide = std::intmax_t;
    constexpr Wide max = std::numeric_limits<T>::max();
    constexpr Wide min = std::numeric_limits<T>::min();

    Wide current = total;
    Wide step = static_cast<Wide>(delta);
    if (step >= 0 && current >= 0 && step > max - current) {
        total = std::numeric_limits<T>::max();
    } else if (step < 0 && current <= 0 && step < min - current) {
        total = std::numeric_limits<T>::min();
    } else {
        total = static_cast<T>(current + step);
    }
}

} // namespace helm::util
