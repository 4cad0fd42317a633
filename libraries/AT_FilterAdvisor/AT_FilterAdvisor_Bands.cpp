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
  noise band table and band driven supplementary advisories
 */

#include "AT_FilterAdvisor.h"

#include <cmath>

#include <AT_Math/AT_Math.h>

#define BAND_SEVERE                 7
#define BAND_LOW_SEVERE             8
#define HIGH_NOISE_LEVEL            70.0f
#define HEAVY_VEHICLE_WEIGHT_G      500.0f

#define LOW_NOTCH_CUTOFF_RATIO      0.7f
#define PROP_NOTCH_CUTOFF_RATIO     0.65f
#define DTERM_LPF2_RATIO            0.7f

struct band_def {
    const char *name;
    float min_hz;
    float max_hz;
    const char *source;
    AT_FilterAdvisor::Category category;
};

static const band_def band_table[] = {
    { "PropWash",        5,   30,  "Turbulence, tuning issues",          AT_FilterAdvisor::Category::LOW  },
    { "Mechanical Low",  30,  60,  "Frame vibrations, motor balance",    AT_FilterAdvisor::Category::LOW  },
    { "Mechanical Mid",  60,  120, "Props, motor mounts",                AT_FilterAdvisor::Category::MID  },
    { "Mechanical High", 120, 180, "Motors, bearings",                   AT_FilterAdvisor::Category::HIGH },
    { "Aliasing",        180, 300, "Gyro sampling, high-frequency noise", AT_FilterAdvisor::Category::HIGH },
    { "Electrical",      300, 500, "ESC, PWM issues",                    AT_FilterAdvisor::Category::HIGH },
};

uint8_t AT_FilterAdvisor::num_bands()
{
    return ARRAY_SIZE(band_table);
}

const char *AT_FilterAdvisor::category_name(Category c)
{
    switch (c) {
    case Category::LOW:
        return "LOW";
    case Category::MID:
        return "MID";
    case Category::HIGH:
        return "HIGH";
    }
    return "?";
}

std::vector<AT_FilterAdvisor::NoiseBand> AT_FilterAdvisor::classify_bands(const std::vector<AT_Spectrum::Point> &spectrum)
{
    std::vector<NoiseBand> bands;
    bands.reserve(ARRAY_SIZE(band_table));

    for (const band_def &def : band_table) {
        NoiseBand band {};
        band.name = def.name;
        band.min_hz = def.min_hz;
        band.max_hz = def.max_hz;
        band.source = def.source;
        band.category = def.category;

        float max_mag = 0;
        for (const AT_Spectrum::Point &p : spectrum) {
            if (p.freq_hz < def.min_hz || p.freq_hz > def.max_hz || !std::isfinite(p.magnitude)) {
                continue;
            }
            if (p.magnitude > max_mag) {
                max_mag = p.magnitude;
                band.dominant_peak = p;
            }
        }
        band.severity = uint8_t(MIN(10, round_int32(max_mag * 100.0f)));
        bands.push_back(band);
    }
    return bands;
}

void AT_FilterAdvisor::add_supplementary(const std::vector<NoiseBand> &bands,
                                         float noise_level,
                                         float weight_g,
                                         Recommendations &out)
{
    bool have_low = false;
    bool have_mid = false;
    bool have_high = false;

    for (const NoiseBand &band : bands) {
        if (band.severity <= BAND_SEVERE || !std::isfinite(band.dominant_peak.freq_hz)) {
            continue;
        }
        const float peak_hz = band.dominant_peak.freq_hz;

        switch (band.category) {
        case Category::LOW: {
            if (band.severity <= BAND_LOW_SEVERE || have_low) {
                break;
            }
            have_low = true;
            FilterRecommendation r {};
            r.enabled = true;
            r.kind = Kind::NOTCH_STATIC;
            r.topology = Topology::PT1;
            r.cutoff_hz = round_int32(peak_hz);
            r.title = "Static notch for low frequency noise";
            r.description = at_sprintf("Static notch at %d Hz, linked to %s",
                                       int(round_int32(peak_hz)), band.source);
            r.command = at_sprintf("set gyro_notch1_enable = ON\n"
                                   "set gyro_notch1_hz = %d\n"
                                   "set gyro_notch1_cutoff = %d",
                                   int(round_int32(peak_hz)),
                                   int(round_int32(peak_hz * LOW_NOTCH_CUTOFF_RATIO)));
            out.additional.push_back(r);
            out.notes.push_back(at_sprintf("Significant low frequency noise (%.0f-%.0f Hz). "
                                           "Check flight controller mounting, prop and motor balance.",
                                           band.min_hz, band.max_hz));
            break;
        }

        case Category::MID: {
            if (have_mid) {
                break;
            }
            have_mid = true;
            if (!out.notch.enabled) {
                FilterRecommendation r {};
                r.enabled = true;
                r.kind = Kind::NOTCH_STATIC;
                r.topology = Topology::PT1;
                r.cutoff_hz = round_int32(peak_hz);
                r.title = "Static notch for propeller noise";
                r.description = at_sprintf("Static notch for propeller resonance at %d Hz",
                                           int(round_int32(peak_hz)));
                r.command = at_sprintf("set gyro_notch1_enable = ON\n"
                                       "set gyro_notch1_hz = %d\n"
                                       "set gyro_notch1_cutoff = %d",
                                       int(round_int32(peak_hz)),
                                       int(round_int32(peak_hz * PROP_NOTCH_CUTOFF_RATIO)));
                out.additional.push_back(r);
            }
            out.notes.push_back(at_sprintf("Propeller noise detected (%.0f-%.0f Hz). "
                                           "Inspect props for damage and replace if worn.",
                                           band.min_hz, band.max_hz));
            break;
        }

        case Category::HIGH: {
            if (have_high) {
                break;
            }
            have_high = true;
            FilterRecommendation r {};
            r.enabled = true;
            r.kind = Kind::NOTCH_DYNAMIC;
            r.topology = Topology::PT1;
            r.cutoff_hz = round_int32(peak_hz);
            r.notch_count = 3;
            r.title = "RPM filter";
            r.description = "Enable RPM filtering to track motor noise directly";
            r.command = "set dshot_bidir = ON\n"
                        "set motor_pwm_protocol = DSHOT600\n"
                        "set rpm_filter_harmonics = 3\n"
                        "set dyn_notch_enable = OFF";
            out.additional.push_back(r);
            out.notes.push_back(at_sprintf("Motor or ESC noise detected (%.0f-%.0f Hz). "
                                           "RPM filtering should improve it considerably.",
                                           band.min_hz, band.max_hz));
            break;
        }
        }
    }

    if (noise_level > HIGH_NOISE_LEVEL) {
        out.notes.push_back("Very high noise level. Fix mechanical problems before tuning PIDs.");

        FilterRecommendation r {};
        r.enabled = true;
        r.kind = Kind::LOWPASS_STATIC;
        r.topology = Topology::PT1;
        r.cutoff_hz = round_int32(out.dterm_lowpass.cutoff_hz * DTERM_LPF2_RATIO);
        r.title = "Second D-term low-pass filter";
        r.description = "Extra D-term filtering to keep motors cool";
        r.command = at_sprintf("set dterm_lowpass2_type = PT1\n"
                               "set dterm_lowpass2_hz = %.0f",
                               r.cutoff_hz);
        out.additional.push_back(r);
    }

    if (std::isfinite(weight_g) && weight_g > HEAVY_VEHICLE_WEIGHT_G) {
        out.notes.push_back(at_sprintf("Heavy vehicle (%.0f g). A higher I term may improve stability.", weight_g));
    }
}
