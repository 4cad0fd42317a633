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
 * @file Report.h
 * @brief Result of one analysis pass
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include <AT_FilterAdvisor/AT_FilterAdvisor.h>
#include <AT_FilterAdvisor/AT_FirmwareProfile.h>
#include <AT_PIDTune/AT_PIDTune.h>
#include <AT_Spectrum/AT_Spectrum.h>
#include <AT_Spectrum/AT_SpectrumCoupling.h>

class Report {
public:
    typedef std::pair<std::string, std::string> Metric;

    float sample_rate_hz;
    float noise_level;
    const AT_FirmwareProfile::Profile *firmware;

    // spectral analysis
    AT_Spectrum::Analysis axes[AT_NUM_AXES];
    std::vector<AT_SpectrumCoupling::CommonFrequency> common;
    std::vector<AT_SpectrumCoupling::Propagation> propagation;
    std::vector<AT_SpectrumCoupling::AxisInteraction> interactions;
    std::vector<AT_FilterAdvisor::NoiseBand> bands;

    /// flight metrics, label to formatted value, in report order
    std::vector<Metric> metrics;

    AT_FilterAdvisor::Recommendations filters;
    AT_PIDTune::Tuning pid;

    Report();

    /// value of a metric, nullptr if absent
    const std::string *metric(const char *label) const;

    /// "set p_roll = N" ... "set d_yaw = N"
    std::string pid_commands() const;

    /// low-pass, notch and supplementary filter commands
    std::string filter_commands() const;

    /// PID block, blank line, filter block, blank line, save
    std::string command_script() const;
};
