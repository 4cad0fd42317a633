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
 * @file AT_PIDTune.h
 * @brief Critical parameter estimation and Ziegler-Nichols PID gain synthesis
 *
 * @details For each axis the stick command and the gyro response are compared.
 *          The command minus response error series is searched for
 *          oscillation peaks; their spacing gives the ultimate period Tu and
 *          their amplitude the ultimate gain Ku. Gains then follow the classic
 *          table:
 *
 *              P = Kp*Ku,  I = Ki*Ku/Tu,  D = Kd*Ku*Tu
 *
 *          and are clamped to per-axis bounds. Roll and pitch use the PIDQuad
 *          row, yaw uses PI.
 *
 *          Estimates are only as good as the flight: a log with no clear
 *          oscillation gives the conservative default Ku=60, Tu=0.25 at LOW
 *          confidence, which is carried through to the report notes.
 */
#pragma once

#include <string>
#include <vector>

#include <AT_Common/AT_Common.h>
#include <AT_Common/AT_SampleLog.h>

class AT_Logger;

class AT_PIDTune {
public:
    enum class Result : uint8_t {
        OK = 0,
        INSUFFICIENT_SAMPLES,
    };

    enum class Confidence : uint8_t {
        LOW    = 0,
        MEDIUM = 1,
        HIGH   = 2,
    };

    enum class ControllerType : uint8_t {
        P        = 0,
        PI       = 1,
        PD       = 2,
        PID      = 3,
        PID_QUAD = 4,
    };

    struct CriticalParams {
        float ku;
        float tu;           ///< seconds
        Confidence confidence;
    };

    struct Coefficients {
        float kp;
        float ki;
        float kd;
    };

    struct Bounds {
        uint16_t p_min, p_max;
        uint16_t i_min, i_max;
        uint16_t d_min, d_max;
    };

    struct AxisGains {
        uint16_t p;
        uint16_t i;
        uint16_t d;
        Confidence confidence;
        CriticalParams critical;
    };

    struct Tuning {
        AxisGains axis[AT_NUM_AXES];
        std::vector<std::string> notes;
        bool fallback;      ///< true if typical gains were used instead of estimates
    };

    static const uint8_t MIN_SAMPLES = 10;
    static constexpr float DEFAULT_KU = 60.0f;
    static constexpr float DEFAULT_TU = 0.25f;

    /**
     * @brief Estimate Ku and Tu from one axis
     *
     * @param[in]  input           command series
     * @param[in]  output          response series
     * @param[in]  sample_rate_hz  rate of both series
     * @param[out] params          estimate, the default when no oscillation is found
     * @return INSUFFICIENT_SAMPLES if either series has fewer than MIN_SAMPLES
     */
    static Result estimate_critical(const std::vector<float> &input,
                                    const std::vector<float> &output,
                                    float sample_rate_hz,
                                    CriticalParams &params) WARN_IF_UNUSED;

    /// default estimate used when no oscillation can be measured
    static CriticalParams default_critical() {
        return CriticalParams{DEFAULT_KU, DEFAULT_TU, Confidence::LOW};
    }

    /// tuning table row, internal error for an unknown type
    static Coefficients coefficients(ControllerType type);

    /**
     * @brief Raw Ziegler-Nichols gains
     *
     * @details Non-positive or non-finite Ku or Tu return the typical gains
     *          30/50/20 and add a note.
     */
    static void calculate(float ku, float tu, ControllerType type,
                          float &p, float &i, float &d,
                          std::vector<std::string> *notes = nullptr);

    static const Bounds &bounds(AT_Axis axis);

    /// controller type used for an axis
    static ControllerType controller_for(AT_Axis axis);

    /// round and clamp raw gains to the axis bounds
    static void clamp_gains(AT_Axis axis, float p, float i, float d, AxisGains &gains);

    /**
     * @brief Tune all three axes from a sample log
     *
     * @details Reads the RC command and gyro channels of each axis. A missing
     *          or short channel, a non-positive sample rate or a non-finite
     *          intermediate gives the fallback gains with a note.
     *
     * @return false if the fallback gains were used
     */
    static bool generate(const AT_SampleLog &log, float sample_rate_hz, Tuning &tuning,
                         AT_Logger *logger = nullptr);

    /// typical gains used when the log cannot be tuned
    static void fallback(Tuning &tuning, const char *reason);

    static const char *confidence_name(Confidence c);

private:
    static void find_peaks(const std::vector<float> &data, std::vector<uint32_t> &peaks);
};
