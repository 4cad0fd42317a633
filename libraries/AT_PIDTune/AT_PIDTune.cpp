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

#include "AT_PIDTune.h"

#include <cmath>

#include <AT_InternalError/AT_InternalError.h>
#include <AT_Logger/AT_Logger.h>
#include <AT_Math/AT_Math.h>

// peaks must exceed this fraction of the error range
#define PEAK_THRESHOLD_RATIO        0.05f
#define PEAK_THRESHOLD_DEFAULT      0.1f

#define KU_MIN                      30.0f
#define KU_MAX                      120.0f
#define TU_MIN                      0.05f
#define TU_MAX                      0.5f

// Ku = KU_SCALE / (mean peak amplitude + KU_AMPLITUDE_OFFSET)
#define KU_SCALE                    100.0f
#define KU_AMPLITUDE_OFFSET         0.1f

static const AT_PIDTune::Coefficients coefficient_table[] = {
    //  Kp     Ki     Kd
    { 0.50f, 0.00f, 0.000f },   // P
    { 0.45f, 0.54f, 0.000f },   // PI
    { 0.80f, 0.00f, 0.100f },   // PD
    { 0.60f, 1.20f, 0.075f },   // PID
    { 0.45f, 0.90f, 0.060f },   // PIDQuad
};

static const AT_PIDTune::Bounds roll_pitch_bounds { 20, 80,  30, 120, 10, 50 };
static const AT_PIDTune::Bounds yaw_bounds        { 20, 100, 40, 120, 0,  20 };

const char *AT_PIDTune::confidence_name(Confidence c)
{
    switch (c) {
    case Confidence::LOW:
        return "low";
    case Confidence::MEDIUM:
        return "medium";
    case Confidence::HIGH:
        return "high";
    }
    return "low";
}

void AT_PIDTune::find_peaks(const std::vector<float> &data, std::vector<uint32_t> &peaks)
{
    peaks.clear();

    const float range = series_range(data);
    const float threshold = is_positive(range) ? range * PEAK_THRESHOLD_RATIO : PEAK_THRESHOLD_DEFAULT;

    for (uint32_t i = 1; i + 1 < data.size(); i++) {
        if (data[i] > data[i-1] && data[i] > data[i+1] && fabsf(data[i]) > threshold) {
            peaks.push_back(i);
        }
    }
}

AT_PIDTune::Result AT_PIDTune::estimate_critical(const std::vector<float> &input,
                                                 const std::vector<float> &output,
                                                 float sample_rate_hz,
                                                 CriticalParams &params)
{
    params = default_critical();

    if (input.size() < MIN_SAMPLES || output.size() < MIN_SAMPLES) {
        return Result::INSUFFICIENT_SAMPLES;
    }
    if (!std::isfinite(sample_rate_hz) || !is_positive(sample_rate_hz)) {
        return Result::OK;
    }

    const uint32_t n = MIN(input.size(), output.size());
    std::vector<float> error(n);
    for (uint32_t i = 0; i < n; i++) {
        error[i] = input[i] - output[i];
    }

    std::vector<uint32_t> peaks;
    find_peaks(error, peaks);
    if (peaks.size() < 2) {
        return Result::OK;
    }

    // mean spacing of consecutive peaks is the span over the peak count
    const float avg_period = float(peaks.back() - peaks.front()) / (peaks.size() - 1) / sample_rate_hz;

    float amp_sum = 0;
    for (const uint32_t idx : peaks) {
        amp_sum += fabsf(error[idx]);
    }
    const float avg_amplitude = amp_sum / peaks.size();

    const float ku = KU_SCALE / (avg_amplitude + KU_AMPLITUDE_OFFSET);

    params.ku = roundf(constrain_float(ku, KU_MIN, KU_MAX));
    params.tu = roundf(constrain_float(avg_period, TU_MIN, TU_MAX) * 1000.0f) / 1000.0f;

    if (peaks.size() > 5 && avg_amplitude > 1.0f) {
        params.confidence = Confidence::HIGH;
    } else if (peaks.size() < 3 || avg_amplitude < 0.5f) {
        params.confidence = Confidence::LOW;
    } else {
        params.confidence = Confidence::MEDIUM;
    }

    return Result::OK;
}

AT_PIDTune::Coefficients AT_PIDTune::coefficients(ControllerType type)
{
    const uint8_t idx = uint8_t(type);
    if (idx >= ARRAY_SIZE(coefficient_table)) {
        INTERNAL_ERROR(AT_InternalError::error_t::invalid_controller_type);
        return Coefficients{0, 0, 0};
    }
    return coefficient_table[idx];
}

void AT_PIDTune::calculate(float ku, float tu, ControllerType type,
                           float &p, float &i, float &d,
                           std::vector<std::string> *notes)
{
    if (!std::isfinite(ku) || !std::isfinite(tu) || !is_positive(ku) || !is_positive(tu)) {
        p = 30;
        i = 50;
        d = 20;
        if (notes != nullptr) {
            notes->push_back("Default gains used, critical parameters could not be determined");
        }
        return;
    }

    const Coefficients c = coefficients(type);
    p = roundf(c.kp * ku);
    i = roundf(c.ki * ku / tu);
    d = roundf(c.kd * ku * tu);
}

const AT_PIDTune::Bounds &AT_PIDTune::bounds(AT_Axis axis)
{
    return axis == AT_Axis::YAW ? yaw_bounds : roll_pitch_bounds;
}

AT_PIDTune::ControllerType AT_PIDTune::controller_for(AT_Axis axis)
{
    return axis == AT_Axis::YAW ? ControllerType::PI : ControllerType::PID_QUAD;
}

void AT_PIDTune::clamp_gains(AT_Axis axis, float p, float i, float d, AxisGains &gains)
{
    const Bounds &b = bounds(axis);
    gains.p = uint16_t(round_int32(constrain_float(p, b.p_min, b.p_max)));
    gains.i = uint16_t(round_int32(constrain_float(i, b.i_min, b.i_max)));
    gains.d = uint16_t(round_int32(constrain_float(d, b.d_min, b.d_max)));
}

void AT_PIDTune::fallback(Tuning &tuning, const char *reason)
{
    static const uint16_t typical[AT_NUM_AXES][3] = {
        { 40, 80, 25 },
        { 40, 80, 25 },
        { 50, 80, 0 },
    };
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        AxisGains &g = tuning.axis[a];
        g.p = typical[a][0];
        g.i = typical[a][1];
        g.d = typical[a][2];
        g.confidence = Confidence::LOW;
        g.critical = default_critical();
    }
    tuning.notes.clear();
    tuning.notes.push_back(at_sprintf("Typical PID values used: %s", reason));
    tuning.fallback = true;
}

bool AT_PIDTune::generate(const AT_SampleLog &log, float sample_rate_hz, Tuning &tuning, AT_Logger *logger)
{
    tuning.notes.clear();
    tuning.fallback = false;

    if (!std::isfinite(sample_rate_hz) || !is_positive(sample_rate_hz)) {
        fallback(tuning, "sample rate unknown");
        AT_LOG_TEXT(logger, AT_Logger::Severity::WARNING, "PID tune: sample rate unknown, using typical gains");
        return false;
    }

    std::vector<std::string> notes;
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        const AT_Axis axis = AT_Axis(a);
        const std::vector<float> input = log.channel(AT_SampleLog::Field::RC, axis);
        const std::vector<float> output = log.channel(AT_SampleLog::Field::GYRO, axis);

        CriticalParams crit;
        if (estimate_critical(input, output, sample_rate_hz, crit) != Result::OK) {
            const std::string reason = at_sprintf("not enough %s samples", at_axis_cli_name(axis));
            fallback(tuning, reason.c_str());
            AT_LOG_TEXT(logger, AT_Logger::Severity::WARNING, "PID tune: %s", reason.c_str());
            return false;
        }

        float p, i, d;
        calculate(crit.ku, crit.tu, controller_for(axis), p, i, d, &notes);
        if (!std::isfinite(p) || !std::isfinite(i) || !std::isfinite(d)) {
            fallback(tuning, "gain calculation failed");
            AT_LOG_TEXT(logger, AT_Logger::Severity::WARNING, "PID tune: non-finite gains on %s", at_axis_cli_name(axis));
            return false;
        }

        AxisGains &g = tuning.axis[a];
        clamp_gains(axis, p, i, d, g);
        g.confidence = crit.confidence;
        g.critical = crit;

        if (logger != nullptr) {
            logger->Write("PIDT", "Axis,Ku,Tu,Conf,P,I,D", "BffBHHH",
                          a,
                          (double)crit.ku,
                          (double)crit.tu,
                          uint8_t(crit.confidence),
                          g.p, g.i, g.d);
        }
    }

    const Confidence roll_conf = tuning.axis[uint8_t(AT_Axis::ROLL)].confidence;
    const Confidence pitch_conf = tuning.axis[uint8_t(AT_Axis::PITCH)].confidence;
    if (roll_conf == Confidence::LOW || pitch_conf == Confidence::LOW) {
        tuning.notes.push_back("Low confidence in PID recommendations. Use them as a starting point and tune gradually.");
    } else if (roll_conf == Confidence::HIGH && pitch_conf == Confidence::HIGH) {
        tuning.notes.push_back("High confidence in PID recommendations. Values should be close to optimal.");
    } else {
        tuning.notes.push_back("Medium confidence in PID recommendations. Some fine tuning may be needed.");
    }

    const CriticalParams &rc = tuning.axis[uint8_t(AT_Axis::ROLL)].critical;
    const CriticalParams &pc = tuning.axis[uint8_t(AT_Axis::PITCH)].critical;
    tuning.notes.push_back(at_sprintf("Based on critical parameters: Roll (Ku=%.0f, Tu=%.3fs), Pitch (Ku=%.0f, Tu=%.3fs)",
                                      rc.ku, rc.tu, pc.ku, pc.tu));

    for (const std::string &n : notes) {
        tuning.notes.push_back(n);
    }

    return true;
}
