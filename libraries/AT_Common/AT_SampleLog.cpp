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

#include "AT_SampleLog.h"

#include <cmath>
#include <utility>

AT_SampleLog::AT_SampleLog(std::vector<AT_Sample> samples) :
    _samples(std::move(samples))
{
}

std::vector<float> AT_SampleLog::channel(Field field, uint8_t index) const
{
    std::vector<float> ret;

    // reject out of range selectors before allocating anything
    switch (field) {
    case Field::GYRO:
    case Field::PID_P:
    case Field::PID_I:
    case Field::PID_D:
    case Field::RC:
        if (index >= AT_NUM_AXES) {
            return ret;
        }
        break;
    case Field::MOTOR:
        if (index >= ARRAY_SIZE(AT_Sample::motor)) {
            return ret;
        }
        break;
    default:
        break;
    }

    ret.reserve(_samples.size());
    for (const AT_Sample &s : _samples) {
        float v = 0.0f;
        switch (field) {
        case Field::TIME:
            v = s.time_ms;
            break;
        case Field::GYRO:
            v = (index == 0) ? s.gyro.x : (index == 1) ? s.gyro.y : s.gyro.z;
            break;
        case Field::PID_P:
            v = s.pid[index].p;
            break;
        case Field::PID_I:
            v = s.pid[index].i;
            break;
        case Field::PID_D:
            v = s.pid[index].d;
            break;
        case Field::MOTOR:
            v = s.motor[index];
            break;
        case Field::RC:
            v = (index == 0) ? s.rc.roll : (index == 1) ? s.rc.pitch : s.rc.yaw;
            break;
        case Field::RC_THROTTLE:
            v = s.rc.throttle;
            break;
        case Field::BATTERY_VOLTAGE:
            v = s.battery.voltage;
            break;
        case Field::BATTERY_CURRENT:
            v = s.battery.current;
            break;
        }
        ret.push_back(v);
    }
    return ret;
}

float AT_SampleLog::estimate_sample_rate_hz() const
{
    if (_samples.size() <= 2) {
        return DEFAULT_SAMPLE_RATE_HZ;
    }

    double sum_ms = 0;
    uint32_t steps = 0;
    for (uint32_t i = 1; i < _samples.size(); i++) {
        const float diff = _samples[i].time_ms - _samples[i-1].time_ms;
        if (diff > 0 && std::isfinite(diff)) {
            sum_ms += diff;
            steps++;
        }
    }
    if (steps == 0) {
        return DEFAULT_SAMPLE_RATE_HZ;
    }

    const double avg_ms = sum_ms / steps;
    return float(std::round(1000.0 / avg_ms));
}
