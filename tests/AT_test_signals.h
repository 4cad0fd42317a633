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

/*
  synthetic signals and sample logs shared by the unit tests
 */
#pragma once

#include <cmath>
#include <utility>
#include <vector>

#include <AT_Common/AT_SampleLog.h>
#include <AT_Math/definitions.h>

namespace AT_Test {

/// n samples of offset + amplitude*sin(2*PI*freq*t + phase)
inline std::vector<float> sine(float freq_hz, float amplitude, float sample_rate_hz, uint32_t n,
                               float offset = 0.0f, float phase = 0.0f)
{
    std::vector<float> ret(n);
    for (uint32_t i = 0; i < n; i++) {
        ret[i] = offset + amplitude * sinf(float(M_2PI) * freq_hz * i / sample_rate_hz + phase);
    }
    return ret;
}

/// element-wise sum, length of the shorter input
inline std::vector<float> add(const std::vector<float> &a, const std::vector<float> &b)
{
    std::vector<float> ret(a.size() < b.size() ? a.size() : b.size());
    for (uint32_t i = 0; i < ret.size(); i++) {
        ret[i] = a[i] + b[i];
    }
    return ret;
}

/// zeroed sample with a timestamp
inline AT_Sample blank_sample(float time_ms)
{
    AT_Sample s {};
    s.time_ms = time_ms;
    return s;
}

/**
 * @brief Log with the same gyro signal on all axes
 *
 * @details RC commands stay at zero, motors hover at 1500.
 */
inline AT_SampleLog gyro_log(const std::vector<float> &gyro, float sample_rate_hz)
{
    std::vector<AT_Sample> samples;
    samples.reserve(gyro.size());
    for (uint32_t i = 0; i < gyro.size(); i++) {
        AT_Sample s = blank_sample(i * 1000.0f / sample_rate_hz);
        s.gyro.x = gyro[i];
        s.gyro.y = gyro[i];
        s.gyro.z = gyro[i];
        for (uint8_t m = 0; m < 4; m++) {
            s.motor[m] = 1500;
        }
        samples.push_back(s);
    }
    return AT_SampleLog(std::move(samples));
}

}
