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

#include "Parameters.h"

/*
  TUNE_ parameter group
 */
const AT_Param::GroupInfo Parameters::var_info[] = {

    // @Param: FFT_SIZE
    // @DisplayName: FFT window size
    // @Description: Number of samples per transform. Must be a power of 2 between 16 and 16384. Frequency resolution is the sample rate divided by this value.
    // @Range: 16 16384
    // @User: Advanced
    AT_GROUPINFO("FFT_SIZE", 1, Parameters, fft_size, TUNE_FFT_SIZE_DEFAULT),

    // @Param: FFT_HANN
    // @DisplayName: FFT Hann window
    // @Description: Apply a Hann window before the transform. Disable only when the channel is already windowed.
    // @Values: 0:Disabled,1:Enabled
    // @User: Advanced
    AT_GROUPINFO("FFT_HANN", 2, Parameters, fft_hann, 1),

    // @Param: FFT_PAD
    // @DisplayName: FFT zero padding
    // @Description: Zero-pad channels shorter than the window. When disabled channels shorter than half the window are skipped.
    // @Values: 0:Disabled,1:Enabled
    // @User: Advanced
    AT_GROUPINFO("FFT_PAD", 3, Parameters, fft_pad, 1),

    // @Param: SMPL_RATE
    // @DisplayName: Log sample rate
    // @Description: Logging rate of the analysed samples. 0 estimates it from the sample timestamps, falling back to 1000 Hz.
    // @Units: Hz
    // @Range: 0 32000
    // @User: Standard
    AT_GROUPINFO("SMPL_RATE", 4, Parameters, sample_rate_hz, 0),

    // @Param: NOISE_LVL
    // @DisplayName: Noise level override
    // @Description: Overall noise level used for filter recommendations, 0 to 100. A negative value derives it from the roll gyro spectrum.
    // @Range: -1 100
    // @User: Advanced
    AT_GROUPINFO("NOISE_LVL", 5, Parameters, noise_level, -1),

    // @Param: FW_VER
    // @DisplayName: Target firmware version
    // @Description: Firmware version whose filter capabilities are assumed when no version string is supplied with the log
    // @Values: 4.2:4.2,4.3:4.3,4.4:4.4
    // @User: Standard
    AT_GROUPINFO("FW_VER", 6, Parameters, fw_version, TUNE_FW_VERSION_DEFAULT),

    // @Param: LOG_LEVEL
    // @DisplayName: Console message level
    // @Description: Text messages at or above this severity are echoed to the console
    // @Values: 0:Emergency,1:Alert,2:Critical,3:Error,4:Warning,5:Notice,6:Info,7:Debug
    // @User: Advanced
    AT_GROUPINFO("LOG_LEVEL", 7, Parameters, log_level, 6),

    AT_GROUPEND
};

Parameters::Parameters()
{
    AT_Param::setup_object_defaults(this, var_info);
}
