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

#include "decoder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Linecode;

namespace {

std::vector<float> cells(const std::vector<float>& levels, int samplesPerBit) {
    std::vector<float> out;
    for (float level : levels) out.insert(out.end(), samplesPerBit, level);
    return out;
}

}  // namespace

TEST(LineDecoderTest, EmptyWaveformSentinel) {
    LineDecoder<float> decoder(4);
    for (Scheme scheme : ALL_SCHEMES) {
        EXPECT_EQ(decoder.decode(std::vector<float>(), scheme), DECODE_EMPTY_WAVEFORM);
    }
    EXPECT_EQ(decoder.decode(std::vector<float>(), "AMI"), DECODE_EMPTY_WAVEFORM);
}

TEST(LineDecoderTest, InvalidSamplesPerBitSentinel) {
    std::vector<float> waveform = {1, 1, -1, -1};
    EXPECT_EQ(LineDecoder<float>(0).decode(waveform, Scheme::NRZ_L), DECODE_INVALID_SAMPLES_PER_BIT);
    EXPECT_EQ(LineDecoder<float>(-4).decode(waveform, "NRZ-L"), DECODE_INVALID_SAMPLES_PER_BIT);
}

TEST(LineDecoderTest, UnsupportedSchemeSentinel) {
    LineDecoder<float> decoder(2);
    EXPECT_EQ(decoder.decode(cells({1, -1}, 2), "MLT-3"), DECODE_UNSUPPORTED);
}

TEST(LineDecoderTest, SentinelsAreRecognized) {
    EXPECT_TRUE(isDecodeSentinel(DECODE_EMPTY_WAVEFORM));
    EXPECT_TRUE(isDecodeSentinel(DECODE_INVALID_SAMPLES_PER_BIT));
    EXPECT_TRUE(isDecodeSentinel(DECODE_UNSUPPORTED));
    EXPECT_FALSE(isDecodeSentinel("0110"));
    EXPECT_FALSE(isDecodeSentinel(""));
}

TEST(LineDecoderTest, ThresholdFollowsPeak) {
    EXPECT_DOUBLE_EQ(magnitudeThreshold(std::vector<float>{0.0f, 0.01f}), THRESHOLD_FLOOR);
    EXPECT_DOUBLE_EQ(magnitudeThreshold(std::vector<double>{0.5, -2.0, 1.0}), 0.5);
}

TEST(LineDecoderTest, AmiConcreteScenario) {
    std::vector<float> waveform = {
        -1, -1, -1, -1,
         0,  0,  0,  0,
         1,  1,  1,  1
    };
    EXPECT_EQ(LineDecoder<float>(4).decode(waveform, Scheme::AMI), "101");
}

TEST(LineDecoderTest, AmiIgnoresPolarity) {
    EXPECT_EQ(LineDecoder<float>(2).decode(cells({1, 1, 0, -1, -1}, 2), Scheme::AMI), "11011");
}

TEST(LineDecoderTest, AmiToleratesScaleAndNoise) {
    std::vector<float> waveform = {
        2.9f, 3.1f, 3.0f, 2.8f,
        0.2f, -0.1f, 0.3f, 0.0f,
        -3.2f, -2.7f, -3.0f, -3.1f,
        -0.4f, 0.1f, 0.2f, 0.3f
    };
    EXPECT_EQ(LineDecoder<float>(4).decode(waveform, Scheme::AMI), "1010");
}

TEST(LineDecoderTest, NrzLevelNearZeroIsZero) {
    EXPECT_EQ(LineDecoder<float>(2).decode(cells({1, -1, 0.01f, 1}, 2), Scheme::NRZ_L), "1001");
}

TEST(LineDecoderTest, NrzInvertFirstBitIsDefault) {
    LineDecoder<float> decoder(2);
    EXPECT_EQ(decoder.decode(cells({1, 1, -1, 1, 1}, 2), Scheme::NRZ_I), "00110");
    EXPECT_EQ(decoder.decode(cells({-1, 1}, 2), Scheme::NRZ_I), std::string(1, AMBIGUOUS_BIT) + "1");
}

TEST(LineDecoderTest, NrzInvertSkipsQuietCells) {
    // A quiet cell neither counts as a transition nor moves the reference
    EXPECT_EQ(LineDecoder<float>(2).decode(cells({1, 0, -1}, 2), Scheme::NRZ_I), "001");
}

TEST(LineDecoderTest, ManchesterMidCellDirection) {
    LineDecoder<float> decoder(4);
    std::vector<float> waveform = {
        -1, -1,  1,  1,
         1,  1, -1, -1,
        -0.5f, -0.6f, 0.9f, 1.1f
    };
    EXPECT_EQ(decoder.decode(waveform, Scheme::MANCHESTER), "101");
}

TEST(LineDecoderTest, ManchesterFlatCellFallsBackToSign) {
    LineDecoder<float> decoder(2);
    EXPECT_EQ(decoder.decode(cells({1, -1}, 2), Scheme::MANCHESTER), "10");
}

TEST(LineDecoderTest, DifferentialManchesterBoundaryTransitions) {
    std::vector<float> waveform = {
         1, -1,
        -1,  1,
        -1,  1,
         1, -1
    };
    EXPECT_EQ(LineDecoder<float>(2).decode(waveform, Scheme::DIFF_MANCHESTER), "0101");
}

TEST(LineDecoderTest, TrailingPartialCellIgnored) {
    std::vector<float> waveform = {1, 1, 1, 1, -1, -1, -1, -1, 1, 1};
    EXPECT_EQ(LineDecoder<float>(4).decode(waveform, Scheme::NRZ_L), "10");
}

TEST(LineDecoderTest, WaveformShorterThanOneCell) {
    std::vector<float> waveform = {1, 1};
    EXPECT_EQ(LineDecoder<float>(4).decode(waveform, Scheme::NRZ_I), "");
    EXPECT_EQ(LineDecoder<float>(4).decode(waveform, Scheme::AMI_B8ZS), "");
}

TEST(LineDecoderTest, RoundTripComparison) {
    EXPECT_TRUE(roundTripMatches(Scheme::AMI, "101", "101"));
    EXPECT_FALSE(roundTripMatches(Scheme::AMI, "101", "001"));
    EXPECT_FALSE(roundTripMatches(Scheme::NRZ_L, "101", "10"));

    // Bit 0 is a convention default for these two
    EXPECT_TRUE(roundTripMatches(Scheme::NRZ_I, "1011", "0011"));
    EXPECT_TRUE(roundTripMatches(Scheme::DIFF_MANCHESTER, "1", "0"));
    EXPECT_FALSE(roundTripMatches(Scheme::NRZ_I, "1011", "0010"));
    EXPECT_FALSE(roundTripMatches(Scheme::MANCHESTER, "1011", "0011"));

    EXPECT_TRUE(roundTripMatches(Scheme::AMI, "", DECODE_EMPTY_WAVEFORM));
    EXPECT_FALSE(roundTripMatches(Scheme::AMI, "", ""));
    EXPECT_FALSE(roundTripMatches(Scheme::AMI, "101", DECODE_UNSUPPORTED));
}
