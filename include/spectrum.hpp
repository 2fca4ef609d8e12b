/*
Copyright (c) 2024 The liblinecode authors

This file is part of liblinecode.

liblinecode is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

liblinecode is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with liblinecode.  If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

#include <fftw3.h>
#include <vector>
#include <cstddef>

namespace Linecode {

    // Averaged power spectrum of an encoded waveform. The waveform is cut
    // into fftSize long segments (the last one zero padded) and the
    // per-bin power is averaged over all segments.
    class LineSpectrum {
        public:
            explicit LineSpectrum(size_t fftSize = 256);
            ~LineSpectrum();

            LineSpectrum(const LineSpectrum&) = delete;
            LineSpectrum& operator=(const LineSpectrum&) = delete;

            // Returns fftSize/2+1 bins, DC first
            const std::vector<float>& compute(const std::vector<float>& waveform);

            // Share of the total power found in the DC bin by the last compute()
            float dcFraction() const;

            size_t getFftSize() const { return fftSize; }
            size_t getBins() const { return fftSize / 2 + 1; }

        private:
            size_t fftSize;
            float* fftIn;
            fftwf_complex* fftOut;
            fftwf_plan fftPlan;
            std::vector<float> power;
    };
}
