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

#include "spectrum.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <mutex>

using namespace Linecode;

#if defined __arm__ || __aarch64__
#define LINECODE_FFTW_FLAGS (FFTW_DESTROY_INPUT | FFTW_ESTIMATE)
#else
#define LINECODE_FFTW_FLAGS (FFTW_DESTROY_INPUT | FFTW_MEASURE)
#endif

#define LINECODE_MIN_FFT_SIZE 16

// FFTW planner is not thread safe
static std::mutex planMutex;

LineSpectrum::LineSpectrum(size_t fftSize)
: fftSize(std::max<size_t>(fftSize, LINECODE_MIN_FFT_SIZE)),
  power(this->fftSize / 2 + 1, 0.0f)
{
    std::lock_guard<std::mutex> lock(planMutex);

    fftIn   = fftwf_alloc_real(this->fftSize);
    fftOut  = fftwf_alloc_complex(this->fftSize / 2 + 1);
    fftPlan = fftwf_plan_dft_r2c_1d((int) this->fftSize, fftIn, fftOut, LINECODE_FFTW_FLAGS);

    if (fftPlan == nullptr) {
        std::cerr << "fft plan creation error, size " << this->fftSize << "\n";
        fftwf_free(fftIn);
        fftwf_free(fftOut);
        throw LinecodeError("Could not create FFT plan of size " + std::to_string(this->fftSize));
    }
}

LineSpectrum::~LineSpectrum() {
    std::lock_guard<std::mutex> lock(planMutex);
    fftwf_destroy_plan(fftPlan);
    fftwf_free(fftIn);
    fftwf_free(fftOut);
}

const std::vector<float>& LineSpectrum::compute(const std::vector<float>& waveform) {
    size_t bins = getBins();
    size_t segments = 0;
    std::fill(power.begin(), power.end(), 0.0f);

    for (size_t pos = 0; pos < waveform.size(); pos += fftSize, ++segments) {
        // Copy a segment, zero padding the tail
        size_t n = std::min(fftSize, waveform.size() - pos);
        std::memcpy(fftIn, waveform.data() + pos, n * sizeof(float));
        std::memset(fftIn + n, 0, (fftSize - n) * sizeof(float));

        fftwf_execute(fftPlan);

        for (size_t j = 0; j < bins; ++j) {
            power[j] += fftOut[j][0]*fftOut[j][0] + fftOut[j][1]*fftOut[j][1];
        }
    }

    if (segments) {
        for (size_t j = 0; j < bins; ++j) power[j] /= segments;
    }

    return power;
}

float LineSpectrum::dcFraction() const {
    float total = 0.0f;
    for (float p : power) total += p;
    return total > 0.0f? power[0] / total : 0.0f;
}
