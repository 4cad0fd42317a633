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

/**
 * @file AT_SampleLog.h
 * @brief Immutable sequence of telemetry samples with per-field channel extraction
 *
 * @details The analysis libraries never look at whole samples. They read
 *          "channels": the value of one field across every sample of the log,
 *          e.g. the gyro x series or the roll RC command series.
 *
 *          The log cannot tell whether its samples came from a real flight or
 *          were synthesized by an ingestion fallback; both are analysed the
 *          same way.
 */
#pragma once

#include <vector>

#include "AT_Common.h"
#include "AT_Sample.h"

class AT_SampleLog {
public:
    /// Selects which field of AT_Sample a channel is built from
    enum class Field : uint8_t {
        TIME,
        GYRO,           ///< axis selects x/y/z
        PID_P,          ///< axis selects roll/pitch/yaw term
        PID_I,
        PID_D,
        MOTOR,          ///< index selects motor 0..3
        RC,             ///< axis selects roll/pitch/yaw stick
        RC_THROTTLE,
        BATTERY_VOLTAGE,
        BATTERY_CURRENT,
    };

    /// default sample rate used when timestamps give no usable estimate
    static constexpr float DEFAULT_SAMPLE_RATE_HZ = 1000.0f;

    AT_SampleLog() {}
    explicit AT_SampleLog(std::vector<AT_Sample> samples);

    uint32_t size() const { return uint32_t(_samples.size()); }
    bool empty() const { return _samples.empty(); }
    const AT_Sample &operator[](uint32_t i) const { return _samples[i]; }

    /**
     * @brief Extract one field across every sample
     *
     * @param[in] field  field to extract
     * @param[in] index  axis (for GYRO, PID_*, RC) or motor number (for MOTOR)
     * @return channel values in sample order, empty if index is out of range
     */
    std::vector<float> channel(Field field, uint8_t index = 0) const;

    /// convenience wrapper for axis-keyed fields
    std::vector<float> channel(Field field, AT_Axis axis) const {
        return channel(field, uint8_t(axis));
    }

    /**
     * @brief Estimate the logging rate from sample timestamps
     *
     * @details Averages every positive timestamp step and converts to Hz,
     *          rounded to the nearest integer. Logs with fewer than three
     *          samples or without a positive step return DEFAULT_SAMPLE_RATE_HZ.
     */
    float estimate_sample_rate_hz() const;

private:
    std::vector<AT_Sample> _samples;
};
