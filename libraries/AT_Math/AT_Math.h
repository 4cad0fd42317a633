/**
 * @file AT_Math.h
 * @brief Numeric utilities shared by the spectral, filter and PID tuning libraries
 *
 * @details Provides:
 *          - floating-point sign test with FLT_EPSILON tolerance
 *          - constrain helpers for float and integer types
 *          - angle wrapping into (-PI, PI]
 *          - power-of-two tests for transform sizing
 *          - series statistics (see series.h)
 *
 * @note Angles are in radians unless explicitly specified
 */
#pragma once

#include <cfloat>
#include <cmath>
#include <stdint.h>
#include <type_traits>

#include <AT_Common/AT_Common.h>

#include "definitions.h"
#include "series.h"

/**
 * @brief Check whether a float is greater than zero using FLT_EPSILON tolerance
 */
template <typename T>
inline bool is_positive(const T fVal1) {
    static_assert(std::is_floating_point<T>::value, "Template parameter not of type float");
    return (static_cast<float>(fVal1) >= FLT_EPSILON);
}

/**
 * @brief Constrain a value to the range [low, high]
 *
 * @details NaN inputs are returned as the midpoint of the range so a bad
 *          intermediate value can never escape as a recommendation.
 */
template <typename T>
T constrain_value(const T amt, const T low, const T high);

#define constrain_float(amt, low, high) constrain_value(float(amt), float(low), float(high))

inline int16_t constrain_int16(const int16_t amt, const int16_t low, const int16_t high)
{
    return constrain_value(amt, low, high);
}

inline int32_t constrain_int32(const int32_t amt, const int32_t low, const int32_t high)
{
    return constrain_value(amt, low, high);
}

/**
 * @brief Wrap an angle in radians into the range (-PI, PI]
 *
 * @details Non-finite input returns 0.
 */
float wrap_PI(const float radian);

/**
 * @brief Round half away from zero and constrain to int32 range
 *
 * @details Matches the rounding used by firmware console values. Non-finite
 *          input returns 0.
 */
int32_t round_int32(const float v);

/// true if v is a non-zero power of two
inline constexpr bool is_power_of_2(const uint32_t v)
{
    return v != 0 && (v & (v - 1)) == 0;
}

template<typename T>
inline constexpr T sq(const T val)
{
    return val*val;
}

template<typename A, typename B>
static inline auto MIN(const A &one, const B &two) -> decltype(one < two ? one : two)
{
    return one < two ? one : two;
}

template<typename A, typename B>
static inline auto MAX(const A &one, const B &two) -> decltype(one > two ? one : two)
{
    return one > two ? one : two;
}
