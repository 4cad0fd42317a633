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

#include "ArduTune.h"

#include <cmath>

#include <AT_Logger/AT_Logger.h>
#include <AT_Math/AT_Math.h>

Tuner::Tuner()
{
    _params.add_group("TUNE_", &g, Parameters::var_info);
    _params.add_group("VEH_", &_vehicle, AT_VehicleProfile::var_info);
}

float Tuner::resolve_sample_rate(const AT_SampleLog &log) const
{
    const float configured = g.sample_rate_hz;
    if (std::isfinite(configured) && is_positive(configured)) {
        return configured;
    }
    return log.estimate_sample_rate_hz();
}

const AT_FirmwareProfile::Profile &Tuner::resolve_firmware(const char *fw_version) const
{
    if (fw_version != nullptr && fw_version[0] != 0) {
        return AT_FirmwareProfile::for_version(fw_version);
    }
    const std::string configured = at_sprintf("%.1f", (double)g.fw_version.get());
    return AT_FirmwareProfile::for_version(configured.c_str());
}

Tuner::Result Tuner::analyse(const AT_SampleLog &log, const char *fw_version, Report &report,
                             AT_Logger *logger) const
{
    if (logger != nullptr) {
        logger->set_level(AT_Logger::Severity(constrain_int16(g.log_level, 0, 7)));
    }

    report.sample_rate_hz = resolve_sample_rate(log);

    AT_Spectrum spectrum;
    const AT_Spectrum::Result init_ret = spectrum.init(uint16_t(constrain_int32(g.fft_size, 0, UINT16_MAX)),
                                                       report.sample_rate_hz,
                                                       g.fft_hann ? AT_Spectrum::WindowMode::HANN : AT_Spectrum::WindowMode::NONE,
                                                       g.fft_pad ? AT_Spectrum::Padding::ZERO_PAD : AT_Spectrum::Padding::NONE);
    if (init_ret != AT_Spectrum::Result::OK) {
        AT_LOG_TEXT(logger, AT_Logger::Severity::ERROR, "TUNE_FFT_SIZE %d is not a power of 2 in [%u, %u]",
                    int(g.fft_size.get()),
                    unsigned(AT_Spectrum::MIN_WINDOW_SIZE),
                    unsigned(AT_Spectrum::MAX_WINDOW_SIZE));
        return Result::BAD_FFT_SIZE;
    }

    AT_LOG_TEXT(logger, AT_Logger::Severity::INFO, "Analysing %u samples at %.0f Hz, %u point FFT",
                unsigned(log.size()), (double)report.sample_rate_hz, unsigned(spectrum.window_size()));

    // per-axis spectra
    std::vector<float> gyro[AT_NUM_AXES];
    AT_SpectrumCoupling::PointList dominant[AT_NUM_AXES];
    AT_SpectrumCoupling::PointList spectra[AT_NUM_AXES];
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        const AT_Axis axis = AT_Axis(a);
        gyro[a] = log.channel(AT_SampleLog::Field::GYRO, axis);
        const AT_Spectrum::Result ret = spectrum.analyse(gyro[a], report.axes[a], logger);
        if (ret != AT_Spectrum::Result::OK) {
            AT_LOG_TEXT(logger, AT_Logger::Severity::WARNING, "%s gyro skipped: %u samples, need %u",
                        at_axis_name(axis), unsigned(gyro[a].size()), unsigned(spectrum.window_size() / 2));
            // a skipped axis takes no part in coupling either
            gyro[a].clear();
            continue;
        }
        dominant[a] = report.axes[a].dominant;
        spectra[a] = report.axes[a].spectrum;
    }

    // cross-axis relationships
    report.common = AT_SpectrumCoupling::find_common_frequencies(dominant);
    report.propagation = AT_SpectrumCoupling::analyse_propagation(spectrum, spectra, report.common);
    report.interactions = AT_SpectrumCoupling::analyse_axes(gyro, dominant, logger);

    // noise
    const AT_Spectrum::Analysis &roll = report.axes[uint8_t(AT_Axis::ROLL)];
    report.bands = AT_FilterAdvisor::classify_bands(roll.spectrum);
    const float configured_noise = g.noise_level;
    if (std::isfinite(configured_noise) && configured_noise >= 0) {
        report.noise_level = MIN(configured_noise, 100.0f);
    } else {
        report.noise_level = AT_Spectrum::noise_level(roll.spectrum);
    }

    // filters
    report.firmware = &resolve_firmware(fw_version);
    AT_FilterAdvisor::recommend(roll.dominant, report.bands, report.noise_level, *report.firmware,
                                _vehicle.weight_g(), report.filters, logger);

    // PIDs
    if (!AT_PIDTune::generate(log, report.sample_rate_hz, report.pid, logger)) {
        AT_LOG_TEXT(logger, AT_Logger::Severity::NOTICE, "PID tune fell back to typical gains");
    } else if (_vehicle.enabled()) {
        _vehicle.apply(report.pid);
    }

    calculate_metrics(log, report);

    if (logger != nullptr) {
        logger->Write("TUNE", "Fs,N,Noise,Ver,NCom,Fallback", "fHfHBB",
                      (double)report.sample_rate_hz,
                      spectrum.window_size(),
                      (double)report.noise_level,
                      report.firmware->version_floor,
                      uint8_t(MIN(report.common.size(), size_t(UINT8_MAX))),
                      uint8_t(report.pid.fallback));
    }

    return Result::OK;
}
