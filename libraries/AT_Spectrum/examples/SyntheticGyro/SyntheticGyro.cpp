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
  full analysis pass over a synthetic gyro log

  usage: SyntheticGyro [defaults.parm] [firmware version]
 */

#include <stdio.h>

#include <ArduTune/ArduTune.h>
#include <AT_Logger/AT_Logger.h>
#include <AT_Math/AT_Math.h>

#define SAMPLE_RATE_HZ      1000.0f
#define DURATION_S          2
#define RESONANCE_HZ        180.0f
#define PROPWASH_HZ         20.0f

static AT_SampleLog make_log()
{
    std::vector<AT_Sample> samples;
    const uint32_t n = uint32_t(DURATION_S * SAMPLE_RATE_HZ);
    samples.reserve(n);
    for (uint32_t i = 0; i < n; i++) {
        const float t = i / SAMPLE_RATE_HZ;
        AT_Sample s {};
        s.time_ms = t * AT_MSEC_PER_SEC;

        // slow stick sweeps on roll and pitch
        s.rc.roll = 100.0f * sinf(float(M_2PI) * 0.5f * t);
        s.rc.pitch = 100.0f * cosf(float(M_2PI) * 0.5f * t);
        s.rc.throttle = 0.5f;

        // response lags the stick by 30 ms, motor resonance on top
        const float lagged = t - 0.03f;
        const float resonance = 20.0f * sinf(float(M_2PI) * RESONANCE_HZ * t);
        s.gyro.x = 90.0f * sinf(float(M_2PI) * 0.5f * lagged) + resonance + 2.0f * sinf(float(M_2PI) * PROPWASH_HZ * t);
        s.gyro.y = 90.0f * cosf(float(M_2PI) * 0.5f * lagged) + 0.6f * resonance;
        s.gyro.z = 0.3f * resonance;

        for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
            s.pid[a].p = 0.9f * (a == 0 ? s.rc.roll : (a == 1 ? s.rc.pitch : 0.0f));
        }
        for (uint8_t m = 0; m < 4; m++) {
            s.motor[m] = 1500 + 10 * m;
        }
        s.battery.voltage = 16.4f;
        s.battery.current = 12.0f;
        samples.push_back(s);
    }
    return AT_SampleLog(std::move(samples));
}

int main(int argc, char *argv[])
{
    Tuner tuner;

    if (argc > 1) {
        uint16_t loaded, ignored;
        if (!tuner.param_table().load_defaults_file(argv[1], loaded, ignored)) {
            fprintf(stderr, "Unable to open %s\n", argv[1]);
            return 1;
        }
        printf("Loaded %u parameters from %s (%u ignored)\n", unsigned(loaded), argv[1], unsigned(ignored));
    }
    const char *fw_version = argc > 2 ? argv[2] : nullptr;

    AT_Logger logger;
    logger.set_console(stdout);

    Report report;
    if (tuner.analyse(make_log(), fw_version, report, &logger) != Tuner::Result::OK) {
        fprintf(stderr, "Analysis failed\n");
        return 1;
    }

    printf("\nFirmware profile %s, sample rate %.0f Hz, noise level %.1f\n",
           report.firmware->name, (double)report.sample_rate_hz, (double)report.noise_level);

    printf("\nMetrics:\n");
    for (const Report::Metric &m : report.metrics) {
        printf("  %-28s %s\n", m.first.c_str(), m.second.c_str());
    }

    printf("\nNoise bands (roll):\n");
    for (const AT_FilterAdvisor::NoiseBand &b : report.bands) {
        printf("  %-16s %3.0f-%3.0f Hz  severity %2u  %s\n",
               b.name, (double)b.min_hz, (double)b.max_hz, unsigned(b.severity),
               AT_FilterAdvisor::category_name(b.category));
    }

    printf("\nNotes:\n");
    for (const std::string &n : report.filters.notes) {
        printf("  %s\n", n.c_str());
    }
    for (const std::string &n : report.pid.notes) {
        printf("  %s\n", n.c_str());
    }

    printf("\nCommand script:\n%s\n", report.command_script().c_str());

    return 0;
}
