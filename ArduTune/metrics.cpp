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
  flight metrics summarised in the report
 */

#include "ArduTune.h"

#include <cmath>

#include <AT_Math/AT_Math.h>

#define REPORT_TOP_PEAKS    3

float Tuner::response_time_ms(const std::vector<float> &command,
                              const std::vector<float> &response,
                              float sample_rate_hz,
                              uint16_t max_lag_ms)
{
    const size_t n = MIN(command.size(), response.size());
    if (n < 2 || !std::isfinite(sample_rate_hz) || !is_positive(sample_rate_hz)) {
        return 0.0f;
    }

    const double mean_c = series_mean(command);
    const double mean_r = series_mean(response);

    const size_t max_lag = MIN(size_t(std::lround(max_lag_ms * sample_rate_hz / 1000.0f)), n - 1);
    double best = 0;
    size_t best_lag = 0;
    bool found = false;
    for (size_t lag = 0; lag <= max_lag; lag++) {
        double sum = 0;
        for (size_t i = 0; i + lag < n; i++) {
            sum += (command[i] - mean_c) * (response[i + lag] - mean_r);
        }
        // normalize by overlap so long lags are not penalised for fewer terms
        sum /= double(n - lag);
        if (std::isfinite(sum) && is_positive(sum) && (!found || sum > best)) {
            best = sum;
            best_lag = lag;
            found = true;
        }
    }

    return found ? float(best_lag * 1000.0 / sample_rate_hz) : 0.0f;
}

void Tuner::calculate_metrics(const AT_SampleLog &log, Report &report)
{
    report.metrics.clear();

    std::vector<float> gyro[AT_NUM_AXES];
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        gyro[a] = log.channel(AT_SampleLog::Field::GYRO, AT_Axis(a));
    }

    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        report.metrics.push_back(Report::Metric(at_sprintf("Gyro Noise (%s)", at_axis_name(AT_Axis(a))),
                                                at_sprintf("%.2f", (double)series_std_dev(gyro[a]))));
    }

    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        const std::vector<float> p_term = log.channel(AT_SampleLog::Field::PID_P, AT_Axis(a));
        report.metrics.push_back(Report::Metric(at_sprintf("PID Error (%s)", at_axis_name(AT_Axis(a))),
                                                at_sprintf("%.2f", (double)series_rmse(gyro[a], p_term))));
    }

    std::vector<float> motors;
    for (uint8_t m = 0; m < ARRAY_SIZE(AT_Sample::motor); m++) {
        const std::vector<float> ch = log.channel(AT_SampleLog::Field::MOTOR, m);
        motors.insert(motors.end(), ch.begin(), ch.end());
    }
    report.metrics.push_back(Report::Metric("Motor Balance", at_sprintf("%.2f", (double)series_variance(motors))));

    const float response_ms = response_time_ms(log.channel(AT_SampleLog::Field::RC, AT_Axis::ROLL),
                                               gyro[uint8_t(AT_Axis::ROLL)],
                                               report.sample_rate_hz);
    report.metrics.push_back(Report::Metric("Response Time (ms)", at_sprintf("%.2f", (double)response_ms)));

    const std::vector<AT_Spectrum::Point> &dominant = report.axes[uint8_t(AT_Axis::ROLL)].dominant;
    if (dominant.empty()) {
        return;
    }
    report.metrics.push_back(Report::Metric("Dominant Frequency (Hz)", at_sprintf("%.1f", (double)dominant[0].freq_hz)));
    report.metrics.push_back(Report::Metric("FFT Noise Level", at_sprintf("%.1f", (double)report.noise_level)));
    for (uint8_t i = 0; i < MIN(dominant.size(), size_t(REPORT_TOP_PEAKS)); i++) {
        report.metrics.push_back(Report::Metric(at_sprintf("Peak %u (%.1f Hz)", unsigned(i + 1), (double)dominant[i].freq_hz),
                                                at_sprintf("%.3f", (double)dominant[i].magnitude)));
    }
}
