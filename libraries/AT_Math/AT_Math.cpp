/*
   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "AT_Math.h"


template <typename T>
T constrain_value(const T amt, const T low, const T high)
{
    // the check for NaN as a float prevents propagation of floating point
    // errors through any function that uses constrain_value()
    if (std::is_floating_point<T>::value) {
        if (std::isnan(amt)) {
            return (low + high) / 2;
        }
    }

    if (amt < low) {
        return low;
    }

    if (amt > high) {
        return high;
    }

    return amt;
}

template int constrain_value<int>(const int amt, const int low, const int high);
template long constrain_value<long>(const long amt, const long low, const long high);
template long long constrain_value<long long>(const long long amt, const long long low, const long long high);
template short constrain_value<short>(const short amt, const short low, const short high);
template unsigned short constrain_value<unsigned short>(const unsigned short amt, const unsigned short low, const unsigned short high);
template unsigned int constrain_value<unsigned int>(const unsigned int amt, const unsigned int low, const unsigned int high);
template float constrain_value<float>(const float amt, const float low, const float high);
template double constrain_value<double>(const double amt, const double low, const double high);

float wrap_PI(const float radian)
{
    if (!std::isfinite(radian)) {
        return 0.0f;
    }
    float res = std::fmod(radian, float(M_2PI));
    if (res <= -float(M_PI)) {
        res += float(M_2PI);
    } else if (res > float(M_PI)) {
        res -= float(M_2PI);
    }
    return res;
}

int32_t round_int32(const float v)
{
    if (!std::isfinite(v)) {
        return 0;
    }
    const double r = std::round(double(v));
    if (r >= double(INT32_MAX)) {
        return INT32_MAX;
    }
    if (r <= double(INT32_MIN)) {
        return INT32_MIN;
    }
    return int32_t(r);
}

float series_mean(const std::vector<float> &v)
{
    if (v.empty()) {
        return 0.0f;
    }
    double sum = 0;
    for (const float x : v) {
        sum += x;
    }
    return float(sum / v.size());
}

float series_variance(const std::vector<float> &v)
{
    if (v.empty()) {
        return 0.0f;
    }
    const double mean = series_mean(v);
    double sum = 0;
    for (const float x : v) {
        sum += sq(double(x) - mean);
    }
    return float(sum / v.size());
}

float series_std_dev(const std::vector<float> &v)
{
    return sqrtf(series_variance(v));
}

float series_rmse(const std::vector<float> &a, const std::vector<float> &b)
{
    const size_t n = MIN(a.size(), b.size());
    if (n == 0) {
        return 0.0f;
    }
    double sum = 0;
    for (size_t i = 0; i < n; i++) {
        sum += sq(double(a[i]) - double(b[i]));
    }
    return float(std::sqrt(sum / n));
}

float series_range(const std::vector<float> &v)
{
    float lo = 0, hi = 0;
    bool have_finite = false;
    for (const float x : v) {
        if (!std::isfinite(x)) {
            continue;
        }
        if (!have_finite) {
            lo = hi = x;
            have_finite = true;
        } else {
            lo = MIN(lo, x);
            hi = MAX(hi, x);
        }
    }
    return hi - lo;
}
