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
 * @file AT_SpectrumCoupling.h
 * @brief Cross-axis comparison of per-axis spectral analyses
 *
 * @details Vibration from a single source (a bent prop, a loose stack) usually
 *          shows up on more than one gyro axis. These helpers find frequencies
 *          shared between axes, estimate which axis carries the source and how
 *          the vibration propagates, and score how strongly axis pairs are
 *          coupled.
 */
#pragma once

#include <vector>

#include "AT_Spectrum.h"

class AT_SpectrumCoupling {
public:
    /// frequencies closer than this are treated as the same vibration
    static constexpr float MATCH_TOLERANCE_HZ = 5.0f;
    /// relative frequency window used when pairing peaks for phase relation
    static constexpr float PHASE_MATCH_RATIO = 0.05f;

    struct CommonFrequency {
        float freq_hz;      ///< mean of the matched peaks
        float magnitude;    ///< mean of the matched peaks
        uint8_t axis_mask;  ///< bit n set if axis n carries the peak
    };

    struct Propagation {
        struct Target {
            AT_Axis axis;
            float phase_diff;       ///< target minus source, (-PI, PI]
            float delay_ms;
            float magnitude_ratio;  ///< target / source
        };
        float freq_hz;
        AT_Axis source;
        std::vector<Target> targets;
    };

    struct AxisInteraction {
        AT_Axis axis1;
        AT_Axis axis2;
        float correlation;
        float phase_relation;
        float coupling_strength;
    };

    typedef std::vector<AT_Spectrum::Point> PointList;

    /**
     * @brief Frequencies present on at least two axes
     *
     * @details Every roll peak is matched against the first pitch and first
     *          yaw peak within tolerance. Pitch peaks not already covered are
     *          then matched against yaw. Sorted by magnitude, strongest first.
     */
    static std::vector<CommonFrequency> find_common_frequencies(const PointList (&dominant)[AT_NUM_AXES]);

    /**
     * @brief Source axis, phase lag and relative strength per common frequency
     *
     * @param[in] engine   transform that produced the spectra, for bin lookup
     * @param[in] spectra  per-axis spectra
     * @param[in] common   output of find_common_frequencies()
     */
    static std::vector<Propagation> analyse_propagation(const AT_Spectrum &engine,
                                                        const PointList (&spectra)[AT_NUM_AXES],
                                                        const std::vector<CommonFrequency> &common);

    /// zero-lag normalized cross-correlation over the overlap, 0 if either has no variance
    static float cross_correlation(const std::vector<float> &a, const std::vector<float> &b);

    /// magnitude-product weighted mean phase difference of peaks paired within 5%
    static float phase_relation(const PointList &dominant1, const PointList &dominant2);

    /// 0.4*|corr| + 0.3*shared fraction + 0.3*cos^2(phase), in [0, 1]; 0 when either set is empty
    static float coupling_strength(const PointList &dominant1, const PointList &dominant2,
                                   float correlation, float phase);

    /**
     * @brief Correlation, phase relation and coupling for roll-pitch, roll-yaw, pitch-yaw
     *
     * @details Pairs where either channel is empty are skipped.
     */
    static std::vector<AxisInteraction> analyse_axes(const std::vector<float> (&gyro)[AT_NUM_AXES],
                                                     const PointList (&dominant)[AT_NUM_AXES],
                                                     AT_Logger *logger = nullptr);
};
