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

#include <string>
#include <cstddef>

namespace Linecode {

    // Drop whitespace and commas, "1 0,1\n1" -> "1011"
    std::string normalizeBits(const std::string& text);

    // Throws InvalidInputError on the first symbol other than '0' or '1'
    void validateBits(const std::string& bits);

    // Throws ConfigurationError unless waveformSize == bitCount * samplesPerBit
    void checkAlignment(size_t waveformSize, size_t bitCount, int samplesPerBit);

    // Throws InvalidInputError if bitCount bits would need more than maxSamples samples
    void checkSampleLimit(size_t bitCount, int samplesPerBit, size_t maxSamples);
}
