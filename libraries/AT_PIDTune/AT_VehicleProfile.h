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
 * @file AT_VehicleProfile.h
 * @brief Airframe description used to scale synthesized PID gains
 *
 * @details Ziegler-Nichols gains only see the logged response. Prop size,
 *          weight, battery, motor KV and frame geometry shift the gains a
 *          tuner would actually fly, so an optional post step scales each
 *          axis by factors derived from these hints and re-clamps the result.
 */
#pragma once

#include <AT_Param/AT_Param.h>

#include "AT_PIDTune.h"

class AT_VehicleProfile {
public:
    AT_VehicleProfile();

    CLASS_NO_COPY(AT_VehicleProfile);

    enum class Frame : uint8_t {
        X = 0,
        H = 1,
    };

    struct Factors {
        float kp;
        float ki;
        float kd;
    };

    bool enabled() const { return _enable != 0; }
    float weight_g() const { return _weight_g; }
    float battery_voltage() const;

    /// common factors before per-axis adjustment
    Factors factors() const;

    /// factors for one axis, frame and yaw adjustments included
    Factors axis_factors(AT_Axis axis) const;

    /**
     * @brief Scale a tuning by the airframe factors
     *
     * @details Does nothing for a fallback tuning. Scaled gains are clamped
     *          back into the axis bounds.
     */
    void apply(AT_PIDTune::Tuning &tuning) const;

    static const struct AT_Param::GroupInfo var_info[];

    // parameters
    AT_Int8 _enable;
    AT_Float _prop_in;
    AT_Float _weight_g;
    AT_Int8 _cells;
    AT_Int16 _motor_kv;
    AT_Int8 _frame;
};
