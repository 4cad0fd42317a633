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

#include "Report.h"

Report::Report() :
    sample_rate_hz(0),
    noise_level(0),
    firmware(nullptr),
    axes(),
    filters(),
    pid()
{
}

const std::string *Report::metric(const char *label) const
{
    for (const Metric &m : metrics) {
        if (m.first == label) {
            return &m.second;
        }
    }
    return nullptr;
}

std::string Report::pid_commands() const
{
    std::string ret;
    for (uint8_t a = 0; a < AT_NUM_AXES; a++) {
        const char *name = at_axis_cli_name(AT_Axis(a));
        const AT_PIDTune::AxisGains &g = pid.axis[a];
        if (!ret.empty()) {
            ret += "\n";
        }
        ret += at_sprintf("set p_%s = %u\n"
                          "set i_%s = %u\n"
                          "set d_%s = %u",
                          name, unsigned(g.p),
                          name, unsigned(g.i),
                          name, unsigned(g.d));
    }
    return ret;
}

std::string Report::filter_commands() const
{
    std::string ret = filters.gyro_lowpass.command;
    ret += "\n";
    ret += filters.dterm_lowpass.command;
    ret += "\n";
    ret += filters.notch.command;
    for (const AT_FilterAdvisor::FilterRecommendation &r : filters.additional) {
        ret += "\n";
        ret += r.command;
    }
    return ret;
}

std::string Report::command_script() const
{
    return pid_commands() + "\n\n" + filter_commands() + "\n\nsave";
}
