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
 * @file AT_FirmwareProfile.h
 * @brief Filter capabilities of the target flight firmware, keyed by version
 *
 * @details Profiles are held in an ordered table of (version_floor, Profile)
 *          pairs, version_floor being major*100 + minor. A version string
 *          selects the highest bucket whose floor does not exceed it.
 */
#pragma once

#include <AT_Common/AT_Common.h>

class AT_FirmwareProfile {
public:
    struct Profile {
        uint16_t version_floor;             ///< major*100 + minor
        const char *name;                   ///< "4.3"
        uint16_t max_notch_q;
        uint16_t default_dterm_cutoff_hz;
        uint16_t default_gyro_cutoff_hz;
        bool supports_dynamic_lowpass;
        bool supports_improved_notch;
        bool supports_biquad_dterm;
    };

    /// bucket used for unparseable version strings
    static const uint16_t DEFAULT_VERSION = 403;

    /**
     * @brief Extract the first "major.minor" from a version string
     *
     * @details Accepts "4.4", "4.4.2" and "Betaflight 4.3.1".
     *
     * @param[in]  version  version text
     * @param[out] key      major*100 + minor
     * @return false if no major.minor pair was found
     */
    static bool parse_version(const char *version, uint16_t &key) WARN_IF_UNUSED;

    /// profile for a version key, rounding down to the nearest bucket
    static const Profile &for_key(uint16_t key);

    /// profile for a version string, the default bucket when unparseable
    static const Profile &for_version(const char *version);

    static const Profile &get_default() { return for_key(DEFAULT_VERSION); }

    static uint8_t num_profiles();
    static const Profile &profile(uint8_t i);
};
