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

#include "AT_FilterAdvisor.h"

#include <cmath>

#include <AT_Logger/AT_Logger.h>
#include <AT_Math/AT_Math.h>

// peaks at or below these are ignored when placing low-pass cutoffs
#define GYRO_LPF_PEAK_FLOOR_HZ      50.0f
#define DTERM_LPF_PEAK_FLOOR_HZ     40.0f
#define GYRO_LPF_PEAK_RATIO         0.7f
#define DTERM_LPF_PEAK_RATIO        0.6f

// noise level thresholds, 0..100 scale
#define NOTCH_MIN_NOISE             20.0f
#define NOTCH_EXTRA_COUNT_NOISE     60.0f
#define GYRO_BIQUAD_NOISE           50.0f
#define DTERM_BIQUAD_NOISE          40.0f
#define GYRO_DYN_LPF_NOISE          20.0f
#define DTERM_DYN_LPF_NOISE         30.0f

#define NOTCH_COUNT_DEFAULT         3
#define NOTCH_COUNT_HIGH_NOISE      5
#define NOTCH_LEGACY_MIN_WIDTH_HZ   20
#define NOTCH_LEGACY_WIDTH_RATIO    0.15f

/*
  lowest finite dominant frequency strictly above floor_hz
 */
static bool lowest_peak_above(const std::vector<AT_Spectrum::Point> &dominant, float floor_hz, float &freq_hz)
{
    bool found = false;
    for (const AT_Spectrum::Point &p : dominant) {
        if (!std::isfinite(p.freq_hz) || p.freq_hz <= floor_hz) {
            continue;
        }
        if (!found || p.freq_hz < freq_hz) {
            freq_hz = p.freq_hz;
            found = true;
        }
    }
    return found;
}

/*
  first finite dominant frequency, dominant is ordered strongest first
 */
static bool strongest_peak(const std::vector<AT_Spectrum::Point> &dominant, float &freq_hz)
{
    for (const AT_Spectrum::Point &p : dominant) {
        if (std::isfinite(p.freq_hz) && is_positive(p.freq_hz)) {
            freq_hz = p.freq_hz;
            return true;
        }
    }
    return false;
}

static AT_FilterAdvisor::FilterRecommendation empty_recommendation(AT_FilterAdvisor::Kind kind)
{
    AT_FilterAdvisor::FilterRecommendation r {};
    r.enabled = true;
    r.kind = kind;
    r.topology = AT_FilterAdvisor::Topology::PT1;
    return r;
}

const char *AT_FilterAdvisor::topology_name(Topology t)
{
    switch (t) {
    case Topology::PT1:
        return "PT1";
    case Topology::BIQUAD:
        return "BIQUAD";
    }
    return "PT1";
}

AT_FilterAdvisor::FilterRecommendation
AT_FilterAdvisor::recommend_gyro_lowpass(const std::vector<AT_Spectrum::Point> &dominant,
                                         float noise_level,
                                         const AT_FirmwareProfile::Profile &profile)
{
    FilterRecommendation r = empty_recommendation(Kind::LOWPASS_STATIC);
    r.title = "Gyro low-pass filter";

    float peak_hz;
    if (lowest_peak_above(dominant, GYRO_LPF_PEAK_FLOOR_HZ, peak_hz)) {
        r.cutoff_hz = constrain_float(round_int32(peak_hz * GYRO_LPF_PEAK_RATIO), GYRO_LPF_MIN_HZ, GYRO_LPF_MAX_HZ);
        if (noise_level > GYRO_BIQUAD_NOISE) {
            r.topology = Topology::BIQUAD;
        }
        r.description = at_sprintf("Cutoff placed below the first resonance at %.0f Hz", peak_hz);
    } else {
        if (noise_level > 50) {
            r.cutoff_hz = 90;
        } else if (noise_level > 25) {
            r.cutoff_hz = 120;
        } else {
            r.cutoff_hz = 150;
        }
        r.description = at_sprintf("No resonance above %.0f Hz, cutoff chosen from noise level %.0f",
                                   GYRO_LPF_PEAK_FLOOR_HZ, noise_level);
    }

    if (profile.supports_dynamic_lowpass && noise_level > GYRO_DYN_LPF_NOISE) {
        r.kind = Kind::LOWPASS_DYNAMIC;
        r.has_dynamic_range = true;
        r.dynamic_min_hz = MAX(80, round_int32(r.cutoff_hz * 0.7f));
        r.dynamic_max_hz = MIN(500, round_int32(r.cutoff_hz * 1.5f));
        r.command = at_sprintf("set gyro_lowpass_type = %s\n"
                               "set gyro_lowpass_hz = 0\n"
                               "set dyn_lpf_gyro_min_hz = %u\n"
                               "set dyn_lpf_gyro_max_hz = %u",
                               topology_name(r.topology),
                               unsigned(r.dynamic_min_hz),
                               unsigned(r.dynamic_max_hz));
    } else {
        r.command = at_sprintf("set gyro_lowpass_type = %s\n"
                               "set gyro_lowpass_hz = %.0f",
                               topology_name(r.topology),
                               r.cutoff_hz);
    }
    return r;
}

AT_FilterAdvisor::FilterRecommendation
AT_FilterAdvisor::recommend_dterm_lowpass(const std::vector<AT_Spectrum::Point> &dominant,
                                          float noise_level,
                                          const AT_FirmwareProfile::Profile &profile)
{
    FilterRecommendation r = empty_recommendation(Kind::LOWPASS_STATIC);
    r.title = "D-term low-pass filter";

    float peak_hz;
    if (lowest_peak_above(dominant, DTERM_LPF_PEAK_FLOOR_HZ, peak_hz)) {
        r.cutoff_hz = constrain_float(round_int32(peak_hz * DTERM_LPF_PEAK_RATIO), DTERM_LPF_MIN_HZ, DTERM_LPF_MAX_HZ);
        if (noise_level > DTERM_BIQUAD_NOISE && profile.supports_biquad_dterm) {
            r.topology = Topology::BIQUAD;
        }
        r.description = at_sprintf("Cutoff placed below the first resonance at %.0f Hz", peak_hz);
    } else {
        if (noise_level > 50) {
            r.cutoff_hz = 70;
        } else if (noise_level > 25) {
            r.cutoff_hz = 100;
        } else {
            r.cutoff_hz = 120;
        }
        r.description = at_sprintf("No resonance above %.0f Hz, cutoff chosen from noise level %.0f",
                                   DTERM_LPF_PEAK_FLOOR_HZ, noise_level);
    }

    if (profile.supports_dynamic_lowpass && noise_level > DTERM_DYN_LPF_NOISE) {
        r.kind = Kind::LOWPASS_DYNAMIC;
        r.has_dynamic_range = true;
        r.dynamic_min_hz = MAX(60, round_int32(r.cutoff_hz * 0.7f));
        r.dynamic_max_hz = MIN(250, round_int32(r.cutoff_hz * 1.3f));
        r.command = at_sprintf("set dterm_lowpass_type = %s\n"
                               "set dterm_lowpass_hz = 0\n"
                               "set dyn_lpf_dterm_min_hz = %u\n"
                               "set dyn_lpf_dterm_max_hz = %u",
                               topology_name(r.topology),
                               unsigned(r.dynamic_min_hz),
                               unsigned(r.dynamic_max_hz));
    } else {
        r.command = at_sprintf("set dterm_lowpass_type = %s\n"
                               "set dterm_lowpass_hz = %.0f",
                               topology_name(r.topology),
                               r.cutoff_hz);
    }
    return r;
}

AT_FilterAdvisor::FilterRecommendation
AT_FilterAdvisor::recommend_notch(const std::vector<AT_Spectrum::Point> &dominant,
                                  float noise_level,
                                  const AT_FirmwareProfile::Profile &profile)
{
    FilterRecommendation r = empty_recommendation(Kind::NOTCH_DYNAMIC);
    r.title = "Dynamic notch filter";

    float peak_hz;
    if (noise_level < NOTCH_MIN_NOISE || !strongest_peak(dominant, peak_hz)) {
        r.enabled = false;
        r.description = "Noise too low or no resonance found, dynamic notch not needed";
        r.command = "set dyn_notch_enable = OFF";
        return r;
    }

    r.q = profile.max_notch_q;

    if (profile.supports_improved_notch) {
        int32_t min_hz = constrain_int32(round_int32(peak_hz * 0.5f), NOTCH_MIN_HZ, NOTCH_MAX_HZ);
        int32_t max_hz = constrain_int32(round_int32(peak_hz * 2.0f), NOTCH_MIN_HZ, NOTCH_MAX_HZ);
        if (max_hz <= min_hz) {
            // resonance outside the trackable range, track all of it
            min_hz = NOTCH_MIN_HZ;
            max_hz = NOTCH_MAX_HZ;
        }
        r.cutoff_hz = round_int32(peak_hz);
        r.has_dynamic_range = true;
        r.dynamic_min_hz = uint16_t(min_hz);
        r.dynamic_max_hz = uint16_t(max_hz);
        r.notch_width_hz = uint16_t(round_int32((max_hz - min_hz) * 0.5f));
        r.notch_count = noise_level > NOTCH_EXTRA_COUNT_NOISE ? NOTCH_COUNT_HIGH_NOISE : NOTCH_COUNT_DEFAULT;
        r.description = at_sprintf("Track resonance at %.0f Hz with %u notches",
                                   peak_hz, unsigned(r.notch_count));
        r.command = at_sprintf("set dyn_notch_enable = ON\n"
                               "set dyn_notch_count = %u\n"
                               "set dyn_notch_q = %u\n"
                               "set dyn_notch_min_hz = %u\n"
                               "set dyn_notch_max_hz = %u",
                               unsigned(r.notch_count),
                               unsigned(r.q),
                               unsigned(r.dynamic_min_hz),
                               unsigned(r.dynamic_max_hz));
    } else {
        const int32_t center = constrain_int32(round_int32(peak_hz), NOTCH_MIN_HZ, NOTCH_MAX_HZ);
        const int32_t width = MAX(NOTCH_LEGACY_MIN_WIDTH_HZ, round_int32(center * NOTCH_LEGACY_WIDTH_RATIO));
        r.cutoff_hz = center;
        r.has_dynamic_range = true;
        r.dynamic_min_hz = uint16_t(MAX(int32_t(NOTCH_MIN_HZ), center - width));
        r.dynamic_max_hz = uint16_t(center + 2 * width);
        r.notch_width_hz = uint16_t(width);
        r.description = at_sprintf("Notch centred on resonance at %d Hz, %d Hz wide", int(center), int(width));
        r.command = at_sprintf("set dyn_notch_enable = ON\n"
                               "set dyn_notch_width_percent = %d\n"
                               "set dyn_notch_q = %u\n"
                               "set dyn_notch_min_hz = %u\n"
                               "set dyn_notch_max_hz = %u",
                               int(round_int32(100.0f * width / center)),
                               unsigned(r.q),
                               unsigned(r.dynamic_min_hz),
                               unsigned(r.dynamic_max_hz));
    }
    return r;
}

void AT_FilterAdvisor::recommend(const std::vector<AT_Spectrum::Point> &dominant,
                                 const std::vector<NoiseBand> &bands,
                                 float noise_level,
                                 const AT_FirmwareProfile::Profile &profile,
                                 float weight_g,
                                 Recommendations &out,
                                 AT_Logger *logger)
{
    out.additional.clear();
    out.notes.clear();

    if (!std::isfinite(noise_level)) {
        out.notes.push_back("Noise level unavailable, recommendations assume a quiet airframe");
        noise_level = 0;
    }
    noise_level = constrain_float(noise_level, 0, 100);

    out.gyro_lowpass = recommend_gyro_lowpass(dominant, noise_level, profile);
    out.dterm_lowpass = recommend_dterm_lowpass(dominant, noise_level, profile);
    out.notch = recommend_notch(dominant, noise_level, profile);

    add_supplementary(bands, noise_level, weight_g, out);

    if (logger != nullptr) {
        logger->Write("FLTR", "Noise,Ver,GLpf,GDyn,DLpf,DDyn,Notch,NMin,NMax,NCnt,NAdd", "fHfBfBBHHBB",
                      (double)noise_level,
                      profile.version_floor,
                      (double)out.gyro_lowpass.cutoff_hz,
                      uint8_t(out.gyro_lowpass.has_dynamic_range),
                      (double)out.dterm_lowpass.cutoff_hz,
                      uint8_t(out.dterm_lowpass.has_dynamic_range),
                      uint8_t(out.notch.enabled),
                      out.notch.dynamic_min_hz,
                      out.notch.dynamic_max_hz,
                      out.notch.notch_count,
                      uint8_t(out.additional.size()));
        for (const std::string &note : out.notes) {
            logger->Write_Message(AT_Logger::Severity::NOTICE, note.c_str());
        }
    }
}
