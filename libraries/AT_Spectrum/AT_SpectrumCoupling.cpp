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

#include "AT_SpectrumCoupling.h"

#include <algorithm>
#include <cmath>

#include <AT_Logger/AT_Logger.h>
#include <AT_Math/AT_Math.h>

std::vector<AT_SpectrumCoupling::CommonFrequency>
AT_SpectrumCoupling::find_common_frequencies(const PointList (&dominant)[AT_NUM_AXES])
{
    std::vector<CommonFrequency> common;

    for (const AT_Spectrum::Point &f1 : dominant[0]) {
        uint8_t mask = 1U << 0;
        float freq_sum = f1.freq_hz;
        float mag_sum = f1.magnitude;
        uint8_t matched = 1;
        for (uint8_t axis = 1; axis < AT_NUM_AXES; axis++) {
            for (const AT_Spectrum::Point &f : dominant[axis]) {
                if (fabsf(f1.freq_hz - f.freq_hz) < MATCH_TOLERANCE_HZ) {
                    mask |= 1U << axis;
                    freq_sum += f.freq_hz;
                    mag_sum += f.magnitude;
                    matched++;
                    break;
                }
            }
        }
        if (matched >= 2) {
            common.push_back(CommonFrequency{freq_sum / matched, mag_sum / matched, mask});
        }
    }

    for (const AT_Spectrum::Point &f2 : dominant[1]) {
        bool covered = false;
        for (const CommonFrequency &c : common) {
            if (fabsf(c.freq_hz - f2.freq_hz) < MATCH_TOLERANCE_HZ) {
                covered = true;
                break;
            }
        }
        if (covered) {
            continue;
        }
        for (const AT_Spectrum::Point &f3 : dominant[2]) {
            if (fabsf(f2.freq_hz - f3.freq_hz) < MATCH_TOLERANCE_HZ) {
                common.push_back(CommonFrequency{(f2.freq_hz + f3.freq_hz) * 0.5f,
                                                 (f2.magnitude + f3.magnitude) * 0.5f,
                                                 uint8_t((1U << 1) | (1U << 2))});
                break;
            }
        }
    }

    std::stable_sort(common.begin(), common.end(),
                     [](const CommonFrequency &a, const CommonFrequency &b) { return a.magnitude > b.magnitude; });
    return common;
}

std::vector<AT_SpectrumCoupling::Propagation>
AT_SpectrumCoupling::analyse_propagation(const AT_Spectrum &engine,
                                         const PointList (&spectra)[AT_NUM_AXES],
                                         const std::vector<CommonFrequency> &common)
{
    std::vector<Propagation> ret;

    for (const CommonFrequency &c : common) {
        if (!is_positive(c.freq_hz)) {
            continue;
        }
        const uint16_t bin = engine.bin_for_frequency(c.freq_hz);

        bool have[AT_NUM_AXES] {};
        AT_Spectrum::Point at_bin[AT_NUM_AXES] {};
        uint8_t n_have = 0;
        for (uint8_t axis = 0; axis < AT_NUM_AXES; axis++) {
            if ((c.axis_mask & (1U << axis)) == 0 || bin >= spectra[axis].size()) {
                continue;
            }
            have[axis] = true;
            at_bin[axis] = spectra[axis][bin];
            n_have++;
        }
        if (n_have < 2) {
            continue;
        }

        int8_t source = -1;
        float max_mag = 0;
        for (uint8_t axis = 0; axis < AT_NUM_AXES; axis++) {
            if (have[axis] && at_bin[axis].magnitude > max_mag) {
                max_mag = at_bin[axis].magnitude;
                source = int8_t(axis);
            }
        }
        if (source < 0) {
            // every participating bin is empty
            continue;
        }

        Propagation p;
        p.freq_hz = c.freq_hz;
        p.source = AT_Axis(source);
        for (uint8_t axis = 0; axis < AT_NUM_AXES; axis++) {
            if (!have[axis] || axis == uint8_t(source)) {
                continue;
            }
            Propagation::Target t;
            t.axis = AT_Axis(axis);
            t.phase_diff = wrap_PI(at_bin[axis].phase - at_bin[source].phase);
            t.delay_ms = (t.phase_diff / float(M_2PI)) * (1000.0f / c.freq_hz);
            t.magnitude_ratio = at_bin[axis].magnitude / max_mag;
            p.targets.push_back(t);
        }
        ret.push_back(p);
    }

    return ret;
}

float AT_SpectrumCoupling::cross_correlation(const std::vector<float> &a, const std::vector<float> &b)
{
    const size_t n = MIN(a.size(), b.size());
    if (n == 0) {
        return 0.0f;
    }

    double mean_a = 0, mean_b = 0;
    for (size_t i = 0; i < n; i++) {
        mean_a += a[i];
        mean_b += b[i];
    }
    mean_a /= n;
    mean_b /= n;

    double var_a = 0, var_b = 0, cov = 0;
    for (size_t i = 0; i < n; i++) {
        const double da = a[i] - mean_a;
        const double db = b[i] - mean_b;
        var_a += da * da;
        var_b += db * db;
        cov += da * db;
    }
    if (var_a <= 0 || var_b <= 0) {
        return 0.0f;
    }
    const float corr = float(cov / std::sqrt(var_a * var_b));
    return std::isfinite(corr) ? constrain_float(corr, -1.0f, 1.0f) : 0.0f;
}

float AT_SpectrumCoupling::phase_relation(const PointList &dominant1, const PointList &dominant2)
{
    float total_weight = 0;
    float weighted = 0;
    for (const AT_Spectrum::Point &f1 : dominant1) {
        if (!is_positive(f1.freq_hz)) {
            continue;
        }
        for (const AT_Spectrum::Point &f2 : dominant2) {
            if (fabsf(f1.freq_hz - f2.freq_hz) / f1.freq_hz < PHASE_MATCH_RATIO) {
                const float weight = f1.magnitude * f2.magnitude;
                weighted += wrap_PI(f1.phase - f2.phase) * weight;
                total_weight += weight;
            }
        }
    }
    return is_positive(total_weight) ? weighted / total_weight : 0.0f;
}

float AT_SpectrumCoupling::coupling_strength(const PointList &dominant1, const PointList &dominant2,
                                             float correlation, float phase)
{
    // an axis without dominant frequencies has nothing to couple
    if (dominant1.empty() || dominant2.empty()) {
        return 0.0f;
    }

    uint8_t shared = 0;
    for (const AT_Spectrum::Point &f1 : dominant1) {
        for (const AT_Spectrum::Point &f2 : dominant2) {
            if (fabsf(f1.freq_hz - f2.freq_hz) < MATCH_TOLERANCE_HZ) {
                shared++;
                break;
            }
        }
    }
    const float similarity = float(shared) / MIN(dominant1.size(), dominant2.size());

    if (!std::isfinite(correlation)) {
        correlation = 0;
    }
    if (!std::isfinite(phase)) {
        phase = 0;
    }
    const float coherence = sq(cosf(phase));

    return constrain_float(0.4f * fabsf(correlation) + 0.3f * similarity + 0.3f * coherence, 0.0f, 1.0f);
}

std::vector<AT_SpectrumCoupling::AxisInteraction>
AT_SpectrumCoupling::analyse_axes(const std::vector<float> (&gyro)[AT_NUM_AXES],
                                  const PointList (&dominant)[AT_NUM_AXES],
                                  AT_Logger *logger)
{
    static const uint8_t pairs[][2] = {
        { 0, 1 },
        { 0, 2 },
        { 1, 2 },
    };

    std::vector<AxisInteraction> ret;
    for (const auto &pair : pairs) {
        const uint8_t a = pair[0];
        const uint8_t b = pair[1];
        if (gyro[a].empty() || gyro[b].empty()) {
            continue;
        }
        AxisInteraction ia;
        ia.axis1 = AT_Axis(a);
        ia.axis2 = AT_Axis(b);
        ia.correlation = cross_correlation(gyro[a], gyro[b]);
        ia.phase_relation = phase_relation(dominant[a], dominant[b]);
        ia.coupling_strength = coupling_strength(dominant[a], dominant[b], ia.correlation, ia.phase_relation);
        ret.push_back(ia);

        if (logger != nullptr) {
            logger->Write("CPLG", "A1,A2,Corr,Phase,Cpl", "BBfff",
                          a, b,
                          (double)ia.correlation,
                          (double)ia.phase_relation,
                          (double)ia.coupling_strength);
        }
    }
    return ret;
}
