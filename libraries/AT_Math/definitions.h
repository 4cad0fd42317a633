/**
 * @file definitions.h
 * @brief Mathematical constants used by the analysis libraries
 *
 * @note Redefined here so every platform uses the same precision regardless
 *       of what its libm headers provide.
 */
#pragma once

#include <cmath>

#ifdef M_PI
# undef M_PI
#endif
#define M_PI      (3.141592653589793238462643383279502884)

#ifdef M_PI_2
# undef M_PI_2
#endif
#define M_PI_2    (M_PI / 2)

#define M_2PI         (M_PI * 2)

#define AT_MSEC_PER_SEC   1000U
