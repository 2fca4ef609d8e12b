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

#include "bitstream.hpp"
#include "exceptions.hpp"

#include <cctype>

using namespace Linecode;

std::string Linecode::normalizeBits(const std::string& text) {
    std::string bits;
    bits.reserve(text.size());
    for (char c : text) {
        if (c != ',' && !std::isspace((unsigned char) c)) bits += c;
    }
    return bits;
}

void Linecode::validateBits(const std::string& bits) {
    for (size_t i = 0; i < bits.size(); i++) {
        char c = bits[i];
        if (c != '0' && c != '1') {
            throw InvalidInputError(
                "Invalid bitstream: '" + std::string(1, c) + "' at position " + std::to_string(i)
            );
        }
    }
}

void Linecode::checkAlignment(size_t waveformSize, size_t bitCount, int samplesPerBit) {
    size_t expected = bitCount * (size_t) samplesPerBit;
    if (samplesPerBit <= 0 || waveformSize != expected) {
        throw ConfigurationError(
            "Waveform length " + std::to_string(waveformSize) +
            " does not match expected " + std::to_string(expected)
        );
    }
}

void Linecode::checkSampleLimit(size_t bitCount, int samplesPerBit, size_t maxSamples) {
    size_t perBit = samplesPerBit > 0? (size_t) samplesPerBit : 0;
    if (perBit && bitCount > maxSamples / perBit) {
        throw InvalidInputError(
            "This bitstream would generate " + std::to_string(bitCount * perBit) +
            " samples, more than the limit of " + std::to_string(maxSamples)
        );
    }
}
