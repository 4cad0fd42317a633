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
  in-place iterative radix-2 decimation in time FFT
 */

#include "AT_Spectrum.h"

#include <cmath>

#include <AT_Math/AT_Math.h>

AT_Spectrum::Result AT_Spectrum::transform(const std::vector<float> &block, std::vector<Point> &spectrum) const
{
    spectrum.clear();
    if (_window_size == 0 || block.size() != _window_size) {
        return Result::BAD_TRANSFORM_SIZE;
    }

    const uint16_t n = _window_size;
    std::vector<float> re(block);
    std::vector<float> im(n, 0.0f);

    // bit reversal permutation
    for (uint16_t i = 1, j = 0; i < n; i++) {
        uint16_t bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(re[i], re[j]);
            std::swap(im[i], im[j]);
        }
    }

    // butterflies
    for (uint8_t stage = 1; stage <= _log2_size; stage++) {
        const uint16_t len = uint16_t(1U << stage);
        const uint16_t half = len >> 1;
        const uint16_t step = n / len;
        for (uint16_t start = 0; start < n; start += len) {
            for (uint16_t k = 0; k < half; k++) {
                const float wr = _twiddle_re[k * step];
                const float wi = _twiddle_im[k * step];
                const uint16_t a = start + k;
                const uint16_t b = a + half;
                const float tr = wr * re[b] - wi * im[b];
                const float ti = wr * im[b] + wi * re[b];
                re[b] = re[a] - tr;
                im[b] = im[a] - ti;
                re[a] += tr;
                im[a] += ti;
            }
        }
    }

    const uint16_t bins = n / 2;
    const float scale = 1.0f / bins;
    spectrum.resize(bins);
    for (uint16_t k = 0; k < bins; k++) {
        Point &p = spectrum[k];
        p.freq_hz = k * _bin_resolution;
        p.magnitude = sqrtf(sq(re[k]) + sq(im[k])) * scale;
        p.phase = atan2f(im[k], re[k]);
    }

    return Result::OK;
}
