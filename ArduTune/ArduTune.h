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
 * @file ArduTune.h
 * @brief Analysis orchestrator: one pass from sample log to tuning report
 *
 * @details A run proceeds in this order:
 *          1. resolve sample rate (TUNE_SMPL_RATE or log timestamps)
 *          2. spectral analysis of each gyro axis
 *          3. cross-axis common frequencies, propagation and coupling
 *          4. noise band scoring and noise level of the roll axis
 *          5. filter recommendations for the selected firmware profile
 *          6. PID tuning from command/response, optional vehicle scaling
 *          7. flight metrics
 *
 *          A Tuner holds only configuration. Each call to analyse() is
 *          independent; the caller owns the report and the optional trace.
 *
 *          Logs synthesized by an ingestion fallback are indistinguishable
 *          from recorded logs here and are analysed the same way.
 */
#pragma once

#include <AT_Common/AT_SampleLog.h>
#include <AT_Param/AT_Param.h>
#include <AT_PIDTune/AT_VehicleProfile.h>

#include "Parameters.h"
#include "Report.h"

class AT_Logger;

class Tuner {
public:
    Tuner();

    CLASS_NO_COPY(Tuner);

    enum class Result : uint8_t {
        OK = 0,
        BAD_FFT_SIZE,       ///< TUNE_FFT_SIZE is not a usable transform size
    };

    /// longest lag searched when estimating response time
    static const uint16_t RESPONSE_MAX_LAG_MS = 100;

    /**
     * @brief Analyse one log
     *
     * @param[in]  log         normalized samples
     * @param[in]  fw_version  firmware version string, nullptr or empty uses TUNE_FW_VER
     * @param[out] report      analysis and recommendations
     * @param[in]  logger      optional trace of the run
     */
    Result analyse(const AT_SampleLog &log, const char *fw_version, Report &report,
                   AT_Logger *logger = nullptr) const WARN_IF_UNUSED;

    /// TUNE_ and VEH_ parameters by name
    AT_ParamTable &param_table() { return _params; }

    Parameters &params() { return g; }
    AT_VehicleProfile &vehicle() { return _vehicle; }

    /**
     * @brief Lag of peak cross-correlation between command and response
     *
     * @details Searches lags 0..max_lag_ms. Returns 0 when either series has
     *          no variance.
     */
    static float response_time_ms(const std::vector<float> &command,
                                  const std::vector<float> &response,
                                  float sample_rate_hz,
                                  uint16_t max_lag_ms = RESPONSE_MAX_LAG_MS);

    /// fill report.metrics from the log and the spectral results
    static void calculate_metrics(const AT_SampleLog &log, Report &report);

private:
    Parameters g;
    AT_VehicleProfile _vehicle;
    AT_ParamTable _params;

    float resolve_sample_rate(const AT_SampleLog &log) const;
    const AT_FirmwareProfile::Profile &resolve_firmware(const char *fw_version) const;
};
