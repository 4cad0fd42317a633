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

#include "AT_FirmwareProfile.h"

#include <ctype.h>
#include <stdlib.h>

// ascending by version_floor
static const AT_FirmwareProfile::Profile profiles[] = {
    //  key   name   Q    dterm gyro  dynLPF notch  biquad
    {   402, "4.2", 250,  100,  120,  false, false, true },
    {   403, "4.3", 500,  150,  150,  true,  false, true },
    {   404, "4.4", 600,  150,  180,  true,  true,  true },
};

uint8_t AT_FirmwareProfile::num_profiles()
{
    return ARRAY_SIZE(profiles);
}

const AT_FirmwareProfile::Profile &AT_FirmwareProfile::profile(uint8_t i)
{
    if (i >= ARRAY_SIZE(profiles)) {
        return profiles[ARRAY_SIZE(profiles)-1];
    }
    return profiles[i];
}

bool AT_FirmwareProfile::parse_version(const char *version, uint16_t &key)
{
    if (version == nullptr) {
        return false;
    }
    for (const char *p = version; *p != 0; p++) {
        if (!isdigit((unsigned char)*p)) {
            continue;
        }
        char *end = nullptr;
        const unsigned long major = strtoul(p, &end, 10);
        if (*end == '.' && isdigit((unsigned char)end[1])) {
            const unsigned long minor = strtoul(end+1, nullptr, 10);
            if (major > 99 || minor > 99) {
                return false;
            }
            key = uint16_t(major * 100 + minor);
            return true;
        }
        // skip the rest of this number before looking again
        p = end - 1;
    }
    return false;
}

const AT_FirmwareProfile::Profile &AT_FirmwareProfile::for_key(uint16_t key)
{
    const Profile *ret = &profiles[0];
    for (const Profile &p : profiles) {
        if (p.version_floor <= key) {
            ret = &p;
        }
    }
    return *ret;
}

const AT_FirmwareProfile::Profile &AT_FirmwareProfile::for_version(const char *version)
{
    uint16_t key;
    if (!parse_version(version, key)) {
        return get_default();
    }
    return for_key(key);
}
