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
 * @file AT_FilterAdvisor.h
 * @brief Noise band classification and filter recommendations
 *
 * @details Turns the spectral analysis of a gyro channel into firmware filter
 *          settings:
 *          - gyro and D-term low-pass cutoff, topology and optional dynamic range
 *          - dynamic notch configuration, improved or legacy depending on firmware
 *          - supplementary advisories for severe noise bands (static notches,
 *            RPM filtering, secondary D-term low-pass) and operator notes
 *
 *          Every numeric setting is clamped before it is written into a
 *          command line. Command text uses the firmware console form
 *          "set <parameter> = <value>", one per line.
 */
#pragma once

#include <string>
#include <vector>

#include <AT_Common/AT_Common.h>
#include <AT_Spectrum/AT_Spectrum.h>

#include "AT_FirmwareProfile.h"

class AT_Logger;

class AT_FilterAdvisor {
public:
    enum class Category : uint8_t {
        LOW  = 0,
        MID  = 1,
        HIGH = 2,
    };

    struct NoiseBand {
        const char *name;
        float min_hz;
        float max_hz;
        uint8_t severity;               ///< 0..10
        AT_Spectrum::Point dominant_peak;
        const char *source;             ///< likely physical cause
        Category category;
    };

    enum class Kind : uint8_t {
        LOWPASS_STATIC,
        LOWPASS_DYNAMIC,
        NOTCH_STATIC,
        NOTCH_DYNAMIC,
    };

    enum class Topology : uint8_t {
        PT1,
        BIQUAD,
    };

    struct FilterRecommendation {
        bool enabled;
        Kind kind;
        Topology topology;
        float cutoff_hz;            ///< low-pass cutoff or notch center
        bool has_dynamic_range;
        uint16_t dynamic_min_hz;
        uint16_t dynamic_max_hz;
        uint16_t q;                 ///< 0 when not applicable
        uint8_t notch_count;        ///< 0 when not applicable
        uint16_t notch_width_hz;    ///< 0 when not applicable
        std::string title;
        std::string description;
        std::string command;
    };

    struct Recommendations {
        FilterRecommendation gyro_lowpass;
        FilterRecommendation dterm_lowpass;
        FilterRecommendation notch;
        std::vector<FilterRecommendation> additional;
        std::vector<std::string> notes;
    };

    // low-pass and notch bounds
    static const uint16_t GYRO_LPF_MIN_HZ = 80;
    static const uint16_t GYRO_LPF_MAX_HZ = 200;
    static const uint16_t DTERM_LPF_MIN_HZ = 60;
    static const uint16_t DTERM_LPF_MAX_HZ = 150;
    static const uint16_t NOTCH_MIN_HZ = 80;
    static const uint16_t NOTCH_MAX_HZ = 500;

    /// rows of the band table
    static uint8_t num_bands();

    /**
     * @brief Score every band of the table against a spectrum
     *
     * @details Severity is min(10, round(100 * peak magnitude)) over the
     *          spectrum bins falling inside the band, inclusive of both edges.
     *          A band with no bins keeps severity 0 and a zero peak.
     */
    static std::vector<NoiseBand> classify_bands(const std::vector<AT_Spectrum::Point> &spectrum);

    static FilterRecommendation recommend_gyro_lowpass(const std::vector<AT_Spectrum::Point> &dominant,
                                                       float noise_level,
                                                       const AT_FirmwareProfile::Profile &profile);

    static FilterRecommendation recommend_dterm_lowpass(const std::vector<AT_Spectrum::Point> &dominant,
                                                        float noise_level,
                                                        const AT_FirmwareProfile::Profile &profile);

    /**
     * @brief Dynamic notch settings for the strongest dominant frequency
     *
     * @details Disabled when noise_level < 20 or there is no dominant frequency.
     */
    static FilterRecommendation recommend_notch(const std::vector<AT_Spectrum::Point> &dominant,
                                                float noise_level,
                                                const AT_FirmwareProfile::Profile &profile);

    /**
     * @brief Full recommendation set for one gyro channel
     *
     * @param[in]  dominant     dominant frequencies, strongest first
     * @param[in]  bands        output of classify_bands()
     * @param[in]  noise_level  0..100, non-finite is treated as 0
     * @param[in]  profile      target firmware capabilities
     * @param[in]  weight_g     all-up weight hint, 0 if unknown
     * @param[out] out          recommendations
     * @param[in]  logger       optional trace
     */
    static void recommend(const std::vector<AT_Spectrum::Point> &dominant,
                          const std::vector<NoiseBand> &bands,
                          float noise_level,
                          const AT_FirmwareProfile::Profile &profile,
                          float weight_g,
                          Recommendations &out,
                          AT_Logger *logger = nullptr);

    static const char *category_name(Category c);
    static const char *topology_name(Topology t);

private:
    static void add_supplementary(const std::vector<NoiseBand> &bands,
                                  float noise_level,
                                  float weight_g,
                                  Recommendations &out);
};
