/**
 * @file series.h
 * @brief Summary statistics over sample channels
 *
 * @details All functions accept empty input and return 0 in that case.
 *          Variance is the population variance (divide by N).
 */
#pragma once

#include <stdint.h>
#include <vector>

/// arithmetic mean
float series_mean(const std::vector<float> &v);

/// population variance about the mean
float series_variance(const std::vector<float> &v);

/// population standard deviation
float series_std_dev(const std::vector<float> &v);

/**
 * @brief Root mean square of a - b over the overlapping prefix
 *
 * @return 0 when either series is empty
 */
float series_rmse(const std::vector<float> &a, const std::vector<float> &b);

/// max(v) - min(v) over the finite entries, 0 when there are none
float series_range(const std::vector<float> &v);
