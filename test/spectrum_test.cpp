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
#include "encoder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Linecode;

TEST(LineSpectrumTest, BinCount) {
    LineSpectrum spectrum(64);
    EXPECT_EQ(spectrum.getFftSize(), 64u);
    EXPECT_EQ(spectrum.getBins(), 33u);
    EXPECT_EQ(spectrum.compute(std::vector<float>(100, 0.5f)).size(), 33u);
}

TEST(LineSpectrumTest, SmallSizesAreRaised) {
    LineSpectrum spectrum(4);
    EXPECT_EQ(spectrum.getFftSize(), 16u);
}

TEST(LineSpectrumTest, EmptyWaveform) {
    LineSpectrum spectrum(32);
    const std::vector<float>& power = spectrum.compute(std::vector<float>());
    for (float p : power) EXPECT_EQ(p, 0.0f);
    EXPECT_EQ(spectrum.dcFraction(), 0.0f);
}

TEST(LineSpectrumTest, NrzCarriesDc) {
    LineEncoder<float> encoder(4);
    LineSpectrum spectrum(64);
    spectrum.compute(encoder.encode(std::string(32, '1'), Scheme::NRZ_L));
    EXPECT_NEAR(spectrum.dcFraction(), 1.0f, 1e-5);
}

TEST(LineSpectrumTest, BalancedCodesCarryNoDc) {
    LineEncoder<float> encoder(4);
    LineSpectrum spectrum(64);
    std::string bits = "1101000111010110010111100100110101110001";

    spectrum.compute(encoder.encode(bits, Scheme::MANCHESTER));
    EXPECT_LT(spectrum.dcFraction(), 1e-6f);

    spectrum.compute(encoder.encode(bits, Scheme::DIFF_MANCHESTER));
    EXPECT_LT(spectrum.dcFraction(), 1e-6f);

    // 16 cells per segment, an even number of alternating pulses each
    spectrum.compute(encoder.encode(std::string(64, '1'), Scheme::AMI));
    EXPECT_LT(spectrum.dcFraction(), 1e-6f);
}
