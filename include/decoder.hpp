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

#include "scheme.hpp"
#include "config.hpp"
#include "cells.hpp"

#include <string>
#include <vector>

namespace Linecode {

    // Placeholders returned instead of a bitstream. Decoding is best
    // effort, so bad input degrades to one of these rather than throwing.
    const char DECODE_EMPTY_WAVEFORM[]          = "(Empty waveform)";
    const char DECODE_INVALID_SAMPLES_PER_BIT[] = "(Invalid samplesPerBit)";
    const char DECODE_UNSUPPORTED[]             = "(Unsupported decoding)";

    // Emitted for bit 0 of NRZ-I and Differential Manchester, which has
    // no preceding level to compare against
    const char AMBIGUOUS_BIT = '0';

    bool isDecodeSentinel(const std::string& result);

    // TRUE if decoded reproduces bits, bit 0 excepted for schemes where
    // hasAmbiguousFirstBit(). An empty input must decode to a sentinel.
    bool roundTripMatches(Scheme scheme, const std::string& bits, const std::string& decoded);

    // Turns a sampled waveform back into bits. Every decision is made on
    // cell averages against a peak-relative threshold, so scaled or
    // slightly noisy levels decode the same as exact ones.
    template <typename T>
    class LineDecoder {
        public:
            explicit LineDecoder(int samplesPerBit = DEFAULT_SAMPLES_PER_BIT)
            : samplesPerBit(samplesPerBit) {}

            std::string decode(const std::vector<T>& waveform, Scheme scheme) const;
            std::string decode(const std::vector<T>& waveform, const std::string& scheme) const;

            int getSamplesPerBit() const { return samplesPerBit; }

        private:
            int samplesPerBit;

            std::string decodeNrzL(const Cells<T>& cells) const;
            std::string decodeNrzI(const Cells<T>& cells) const;
            std::string decodeManchester(const Cells<T>& cells) const;
            std::string decodeDiffManchester(const Cells<T>& cells) const;
            std::string decodeAmi(const Cells<T>& cells) const;
    };
}
