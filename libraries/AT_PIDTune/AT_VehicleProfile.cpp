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

#include "AT_VehicleProfile.h"

#include <AT_Math/AT_Math.h>

#define LIPO_CELL_NOMINAL_VOLTS     3.7f

const AT_Param::GroupInfo AT_VehicleProfile::var_info[] = {

    // @Param: ENABLE
    // @DisplayName: Vehicle profile scaling
    // @Description: Scale synthesized PID gains by the airframe description below
    // @Values: 0:Disabled,1:Enabled
    // @User: Standard
    AT_GROUPINFO("ENABLE", 1, AT_VehicleProfile, _enable, 0),

    // @Param: PROP_IN
    // @DisplayName: Propeller size
    // @Description: Propeller diameter. 3 inches and below is treated as a small vehicle, 7 inches and above as a large one.
    // @Units: in
    // @Range: 1 30
    // @User: Standard
    AT_GROUPINFO("PROP_IN", 2, AT_VehicleProfile, _prop_in, 5),

    // @Param: WEIGHT_G
    // @DisplayName: All-up weight
    // @Units: g
    // @Range: 20 10000
    // @User: Standard
    AT_GROUPINFO("WEIGHT_G", 3, AT_VehicleProfile, _weight_g, 400),

    // @Param: CELLS
    // @DisplayName: Battery cell count
    // @Range: 1 14
    // @User: Standard
    AT_GROUPINFO("CELLS", 4, AT_VehicleProfile, _cells, 4),

    // @Param: MOT_KV
    // @DisplayName: Motor KV
    // @Units: rpm/V
    // @Range: 100 10000
    // @User: Advanced
    AT_GROUPINFO("MOT_KV", 5, AT_VehicleProfile, _motor_kv, 2300),

    // @Param: FRAME
    // @DisplayName: Frame geometry
    // @Values: 0:X,1:H
    // @User: Advanced
    AT_GROUPINFO("FRAME", 6, AT_VehicleProfile, _frame, 0),

    AT_GROUPEND
};

AT_VehicleProfile::AT_VehicleProfile()
{
    AT_Param::setup_object_defaults(this, var_info);
}

float AT_VehicleProfile::battery_voltage() const
{
    return _cells * LIPO_CELL_NOMINAL_VOLTS;
}

AT_VehicleProfile::Factors AT_VehicleProfile::factors() const
{
    Factors f {1.0f, 1.0f, 1.0f};

    if (_prop_in <= 3) {
        f.kp *= 1.3f;
        f.kd *= 1.2f;
        f.ki *= 0.8f;
    } else if (_prop_in >= 7) {
        f.kp *= 0.8f;
        f.ki *= 1.3f;
        f.kd *= 0.7f;
    }

    if (_weight_g < 250) {
        f.kp *= 1.2f;
        f.ki *= 0.9f;
    } else if (_weight_g > 600) {
        f.kp *= 0.9f;
        f.ki *= 1.3f;
        f.kd *= 0.8f;
    }

    // 4S and 3S nominal voltages are the neutral band
    const float volts = battery_voltage();
    if (volts > 4 * LIPO_CELL_NOMINAL_VOLTS + 0.01f) {
        f.kp *= 0.9f;
    } else if (volts < 3 * LIPO_CELL_NOMINAL_VOLTS - 0.01f) {
        f.kp *= 1.1f;
    }

    if (_motor_kv > 2500) {
        f.kp *= 0.9f;
        f.kd *= 1.1f;
    } else if (_motor_kv < 1800) {
        f.kp *= 1.1f;
        f.ki *= 1.1f;
    }

    return f;
}

AT_VehicleProfile::Factors AT_VehicleProfile::axis_factors(AT_Axis axis) const
{
    Factors f = factors();
    switch (axis) {
    case AT_Axis::ROLL:
        if (Frame(_frame.get()) == Frame::H) {
            // wider roll inertia on H frames
            f.kp *= 0.95f;
            f.ki *= 1.05f;
        }
        break;
    case AT_Axis::PITCH:
        break;
    case AT_Axis::YAW:
        f.kp *= 0.8f;
        f.ki *= 1.2f;
        f.kd *= 0.5f;
        break;
    }
    return f;
}

void AT_VehicleProfile::apply(AT_PIDTune::Tuning &tuning) const
{
    if (tuning.fallback) {
        return;
    }
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        const AT_Axis axis = AT_Axis(a);
        const Factors f = axis_factors(axis);
        AT_PIDTune::AxisGains &g = tuning.axis[a];
        AT_PIDTune::clamp_gains(axis, g.p * f.kp, g.i * f.ki, g.d * f.kd, g);
    }
    tuning.notes.push_back(at_sprintf("Gains scaled for a %.0f in, %.0f g, %dS, %d KV %s frame",
                                      (double)_prop_in.get(),
                                      (double)_weight_g.get(),
                                      int(_cells.get()),
                                      int(_motor_kv.get()),
                                      Frame(_frame.get()) == Frame::H ? "H" : "X"));
}
