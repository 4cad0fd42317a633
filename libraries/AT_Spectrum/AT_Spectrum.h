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
 * @file AT_Spectrum.h
 * @brief Spectral analysis of a single telemetry channel
 *
 * @details Converts a time series into a one-sided magnitude/phase spectrum,
 *          extracts the dominant frequencies and scores harmonic distortion.
 *
 *          Processing for one channel:
 *          1. take the first N samples (zero-padding short input)
 *          2. apply the configured window (none, Hann or caller supplied)
 *          3. run an in-place iterative radix-2 FFT
 *          4. keep bins 0..N/2-1: frequency = bin*fs/N, magnitude = |X|/(N/2),
 *             phase = atan2(im, re)
 *          5. pick strict interior local maxima above DOMINANT_MIN_MAGNITUDE,
 *             strongest first, at most MAX_DOMINANT of them
 *          6. score harmonic distortion against the strongest peak
 *
 *          Frequency resolution is fs/N: 1024 samples at 1kHz gives 0.98 Hz bins.
 *
 * @note Configure with init(), then set_custom_window() when the window
 *       mode is CUSTOM. After that the instance is read-only and can be
 *       shared between threads.
 */
#pragma once

#include <vector>

#include <AT_Common/AT_Common.h>

class AT_Logger;

class AT_Spectrum {
public:
    enum class Result : uint8_t {
        OK = 0,
        INSUFFICIENT_SAMPLES,   ///< fewer than N/2 samples with padding disabled
        BAD_TRANSFORM_SIZE,     ///< size not a power of two in range, or init() not done
        WINDOW_MISMATCH,        ///< custom window length differs from N
    };

    enum class WindowMode : uint8_t {
        NONE   = 0,   ///< caller already windowed the samples
        HANN   = 1,   ///< Hann window applied internally
        CUSTOM = 2,   ///< coefficients from set_custom_window()
    };

    enum class Padding : uint8_t {
        NONE     = 0,   ///< reject input shorter than N/2
        ZERO_PAD = 1,   ///< zero-pad any short input up to N
    };

    static const uint16_t MIN_WINDOW_SIZE = 16;
    static const uint16_t MAX_WINDOW_SIZE = 16384;
    static const uint8_t MAX_DOMINANT = 10;
    static constexpr float DOMINANT_MIN_MAGNITUDE = 0.01f;

    struct Point {
        float freq_hz;
        float magnitude;
        float phase;        ///< radians, (-PI, PI]
    };

    struct Distortion {
        float thd_percent;
        float stability_score;      ///< 100 - min(100, thd_percent)
        bool oscillation_detected;  ///< strong non-harmonic peak next to the fundamental
    };

    struct Analysis {
        std::vector<Point> spectrum;    ///< N/2 bins by increasing frequency
        std::vector<Point> dominant;    ///< strongest first
        Distortion distortion;
    };

    AT_Spectrum() :
        _window_size(0),
        _log2_size(0),
        _sample_rate_hz(0),
        _bin_resolution(0)
    {}

    /**
     * @brief Size the transform and precompute window and twiddle tables
     *
     * @param[in] window_size     transform size N, power of two in [16, 16384]
     * @param[in] sample_rate_hz  channel sample rate, must be positive
     * @param[in] window          window policy
     * @param[in] padding         short input policy
     */
    Result init(uint16_t window_size, float sample_rate_hz,
                WindowMode window = WindowMode::HANN,
                Padding padding = Padding::ZERO_PAD) WARN_IF_UNUSED;

    /**
     * @brief Select CUSTOM windowing with the given coefficients
     *
     * @details Must follow a successful init(), which fixes N. The instance is
     *          left unchanged on failure.
     *
     * @return BAD_TRANSFORM_SIZE before init(), WINDOW_MISMATCH when
     *         coefficients.size() != N
     */
    Result set_custom_window(const std::vector<float> &coefficients) WARN_IF_UNUSED;

    /**
     * @brief Analyse one channel
     *
     * @param[in]  samples  time series, only the first N are used
     * @param[out] result   spectrum, dominant frequencies and distortion
     * @param[in]  logger   optional trace, receives one SPEC record
     */
    Result analyse(const std::vector<float> &samples, Analysis &result, AT_Logger *logger = nullptr) const WARN_IF_UNUSED;

    /// FFT of a windowed, zero-padded block; BAD_TRANSFORM_SIZE unless block.size() == N
    Result transform(const std::vector<float> &block, std::vector<Point> &spectrum) const WARN_IF_UNUSED;

    uint16_t window_size() const { return _window_size; }
    float sample_rate_hz() const { return _sample_rate_hz; }
    float bin_resolution() const { return _bin_resolution; }
    WindowMode window_mode() const { return _window_mode; }

    /// spectrum bin index containing freq_hz, floor(f*N/fs)
    uint16_t bin_for_frequency(float freq_hz) const;

    /// Hann coefficients for size n, 0.5*(1 - cos(2*PI*i/(n-1)))
    static std::vector<float> hann_window(uint16_t n);

    /// strict interior local maxima above threshold, strongest first, at most MAX_DOMINANT
    static std::vector<Point> find_dominant(const std::vector<Point> &spectrum);

    /// harmonic distortion and stability against the strongest dominant frequency
    static Distortion harmonic_distortion(const std::vector<Point> &dominant);

    /// mean spectrum magnitude scaled to 0..100
    static float noise_level(const std::vector<Point> &spectrum);

private:
    uint16_t _window_size;      ///< 0 until init() succeeds
    uint8_t _log2_size;
    float _sample_rate_hz;
    float _bin_resolution;
    WindowMode _window_mode = WindowMode::HANN;
    Padding _padding = Padding::ZERO_PAD;

    std::vector<float> _window;
    std::vector<float> _twiddle_re;
    std::vector<float> _twiddle_im;

    static bool is_harmonic(const Point &fundamental, const Point &p);
};
