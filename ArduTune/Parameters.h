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
 * @file Parameters.h
 * @brief User settable analysis parameters, TUNE_ group
 *
 * @details Values are defaults for one analysis run. They can be changed by
 *          name through the Tuner's parameter table or loaded from a .parm
 *          defaults file before calling Tuner::analyse().
 */
#pragma once

#include <AT_Param/AT_Param.h>

// parameter defaults
#define TUNE_FFT_SIZE_DEFAULT       1024
#define TUNE_FW_VERSION_DEFAULT     4.3f

class Parameters {
public:
    Parameters();

    CLASS_NO_COPY(Parameters);

    static const struct AT_Param::GroupInfo var_info[];

    AT_Int16        fft_size;           ///< transform size, power of two
    AT_Int8         fft_hann;           ///< 1 = apply Hann window internally
    AT_Int8         fft_pad;            ///< 1 = zero-pad short channels
    AT_Float        sample_rate_hz;     ///< 0 = estimate from timestamps
    AT_Float        noise_level;        ///< negative = derive from spectra
    AT_Float        fw_version;         ///< used when no version string is supplied
    AT_Int8         log_level;          ///< console echo severity limit
};
