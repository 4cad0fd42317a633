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

#include "AT_Spectrum.h"

#include <algorithm>
#include <cmath>

#include <AT_Logger/AT_Logger.h>
#include <AT_Math/AT_Math.h>

// harmonic match window, as a fraction of the fundamental frequency
#define SPECTRUM_HARMONIC_TOLERANCE     0.1f
// non-harmonic peaks above this fraction of the fundamental flag oscillation
#define SPECTRUM_OSCILLATION_RATIO      0.15f
// number of strongest peaks inspected for oscillation, fundamental included
#define SPECTRUM_OSCILLATION_PEAKS      5
// mean magnitude to 0..100 noise scale
#define SPECTRUM_NOISE_LEVEL_SCALE      2500.0f

AT_Spectrum::Result AT_Spectrum::init(uint16_t window_size, float sample_rate_hz,
                                      WindowMode window, Padding padding)
{
    if (window_size < MIN_WINDOW_SIZE || window_size > MAX_WINDOW_SIZE ||
        !is_power_of_2(window_size) ||
        !std::isfinite(sample_rate_hz) || !is_positive(sample_rate_hz)) {
        _window_size = 0;
        return Result::BAD_TRANSFORM_SIZE;
    }

    _window_size = window_size;
    _log2_size = 0;
    while ((1U << _log2_size) < window_size) {
        _log2_size++;
    }
    _sample_rate_hz = sample_rate_hz;
    _bin_resolution = sample_rate_hz / window_size;
    _padding = padding;

    if (window != WindowMode::CUSTOM) {
        _window_mode = window;
        _window = (window == WindowMode::HANN) ? hann_window(window_size) : std::vector<float>();
    } else {
        // coefficients arrive through set_custom_window()
        _window_mode = WindowMode::CUSTOM;
        _window.clear();
    }

    // twiddle factors e^(-2*PI*i*k/N) for k in [0, N/2)
    const uint16_t half = window_size / 2;
    _twiddle_re.resize(half);
    _twiddle_im.resize(half);
    for (uint16_t k = 0; k < half; k++) {
        const double angle = -M_2PI * k / window_size;
        _twiddle_re[k] = float(cos(angle));
        _twiddle_im[k] = float(sin(angle));
    }

    return Result::OK;
}

AT_Spectrum::Result AT_Spectrum::set_custom_window(const std::vector<float> &coefficients)
{
    if (_window_size == 0) {
        return Result::BAD_TRANSFORM_SIZE;
    }
    if (coefficients.size() != _window_size) {
        return Result::WINDOW_MISMATCH;
    }
    _window_mode = WindowMode::CUSTOM;
    _window = coefficients;
    return Result::OK;
}

std::vector<float> AT_Spectrum::hann_window(uint16_t n)
{
    std::vector<float> w(n, 1.0f);
    if (n < 2) {
        return w;
    }
    for (uint16_t i = 0; i < n; i++) {
        w[i] = 0.5f * (1.0f - cosf(float(M_2PI) * i / (n - 1)));
    }
    return w;
}

uint16_t AT_Spectrum::bin_for_frequency(float freq_hz) const
{
    if (_window_size == 0 || !std::isfinite(freq_hz) || !is_positive(freq_hz)) {
        return 0;
    }
    const float bin = floorf(freq_hz * _window_size / _sample_rate_hz);
    return uint16_t(constrain_float(bin, 0, _window_size - 1));
}

AT_Spectrum::Result AT_Spectrum::analyse(const std::vector<float> &samples, Analysis &result, AT_Logger *logger) const
{
    result.spectrum.clear();
    result.dominant.clear();
    result.distortion = Distortion{0.0f, 100.0f, false};

    if (_window_size == 0) {
        return Result::BAD_TRANSFORM_SIZE;
    }
    if (_window_mode == WindowMode::CUSTOM && _window.size() != _window_size) {
        return Result::WINDOW_MISMATCH;
    }
    if (_padding == Padding::NONE && samples.size() < _window_size / 2U) {
        return Result::INSUFFICIENT_SAMPLES;
    }

    std::vector<float> block(_window_size, 0.0f);
    const uint32_t count = MIN(uint32_t(samples.size()), uint32_t(_window_size));
    for (uint32_t i = 0; i < count; i++) {
        const float v = std::isfinite(samples[i]) ? samples[i] : 0.0f;
        block[i] = _window.empty() ? v : v * _window[i];
    }

    const Result ret = transform(block, result.spectrum);
    if (ret != Result::OK) {
        return ret;
    }

    result.dominant = find_dominant(result.spectrum);
    result.distortion = harmonic_distortion(result.dominant);

    if (logger != nullptr) {
        logger->Write("SPEC", "N,Used,Fs,Res,NDom,F0,THD,Stab,Osc", "HIffBfffB",
                      _window_size,
                      count,
                      (double)_sample_rate_hz,
                      (double)_bin_resolution,
                      uint8_t(result.dominant.size()),
                      (double)(result.dominant.empty() ? 0.0f : result.dominant[0].freq_hz),
                      (double)result.distortion.thd_percent,
                      (double)result.distortion.stability_score,
                      uint8_t(result.distortion.oscillation_detected));
    }

    return Result::OK;
}

std::vector<AT_Spectrum::Point> AT_Spectrum::find_dominant(const std::vector<Point> &spectrum)
{
    std::vector<Point> peaks;
    for (uint32_t i = 1; i + 1 < spectrum.size(); i++) {
        const float m = spectrum[i].magnitude;
        if (m > DOMINANT_MIN_MAGNITUDE &&
            m > spectrum[i-1].magnitude &&
            m > spectrum[i+1].magnitude) {
            peaks.push_back(spectrum[i]);
        }
    }

    // stable so equal peaks keep the lower frequency first
    std::stable_sort(peaks.begin(), peaks.end(),
                     [](const Point &a, const Point &b) { return a.magnitude > b.magnitude; });

    if (peaks.size() > MAX_DOMINANT) {
        peaks.resize(MAX_DOMINANT);
    }
    return peaks;
}

bool AT_Spectrum::is_harmonic(const Point &fundamental, const Point &p)
{
    if (!is_positive(fundamental.freq_hz)) {
        return false;
    }
    const float h = roundf(p.freq_hz / fundamental.freq_hz);
    if (h < 2) {
        return false;
    }
    return fabsf(p.freq_hz - h * fundamental.freq_hz) < SPECTRUM_HARMONIC_TOLERANCE * fundamental.freq_hz;
}

AT_Spectrum::Distortion AT_Spectrum::harmonic_distortion(const std::vector<Point> &dominant)
{
    Distortion d {0.0f, 100.0f, false};
    if (dominant.empty()) {
        return d;
    }

    const Point &fundamental = dominant[0];
    float harmonic_power = 0;
    for (uint32_t i = 1; i < dominant.size(); i++) {
        if (is_harmonic(fundamental, dominant[i])) {
            harmonic_power += sq(dominant[i].magnitude);
        }
    }

    if (is_positive(harmonic_power) && is_positive(fundamental.magnitude)) {
        d.thd_percent = 100.0f * sqrtf(harmonic_power) / fundamental.magnitude;
    }
    d.stability_score = 100.0f - MIN(100.0f, d.thd_percent);

    const uint32_t n = MIN(uint32_t(dominant.size()), uint32_t(SPECTRUM_OSCILLATION_PEAKS));
    for (uint32_t i = 1; i < n; i++) {
        if (!is_harmonic(fundamental, dominant[i]) &&
            dominant[i].magnitude > SPECTRUM_OSCILLATION_RATIO * fundamental.magnitude) {
            d.oscillation_detected = true;
            break;
        }
    }

    return d;
}

float AT_Spectrum::noise_level(const std::vector<Point> &spectrum)
{
    if (spectrum.empty()) {
        return 0.0f;
    }
    double sum = 0;
    for (const Point &p : spectrum) {
        sum += p.magnitude;
    }
    const float mean = float(sum / spectrum.size());
    return MIN(100.0f, SPECTRUM_NOISE_LEVEL_SCALE * mean);
}
