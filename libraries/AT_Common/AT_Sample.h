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
 * @file AT_Sample.h
 * @brief One row of normalized flight-controller telemetry
 *
 * @details Samples are produced by the ingestion side (log decoders, column
 *          mappers) and are never modified by the analysis libraries. Any field
 *          the source log did not carry stays at zero.
 *
 *          Units:
 *          - time_ms: milliseconds, monotonic non-decreasing across a log
 *          - gyro: deg/s, x/y/z map to roll/pitch/yaw
 *          - pid: raw P/I/D term outputs per axis
 *          - motor: command units, typically 1000-2000
 *          - rc: stick commands as logged (deg/s setpoint or raw)
 *          - battery: volts and amps
 */
#pragma once

#include "AT_Common.h"

struct AT_Sample {
    float time_ms;

    struct {
        float x;
        float y;
        float z;
    } gyro;

    struct PIDTerms {
        float p;
        float i;
        float d;
    } pid[AT_NUM_AXES];

    float motor[4];

    struct {
        float roll;
        float pitch;
        float yaw;
        float throttle;
    } rc;

    struct {
        float voltage;
        float current;
    } battery;
};
