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
#include "levels.hpp"

#include <string>
#include <vector>
#include <cstddef>

namespace Linecode {

    // Turns a bitstream into a waveform of samplesPerBit samples per bit.
    // The encoder keeps no state between calls, so one instance may be
    // shared by any number of threads.
    //
    // Conventions:
    //  - NRZ-I and Differential Manchester start from a LOW level.
    //  - Manchester sends '1' as LOW->HIGH and '0' as HIGH->LOW.
    //  - AMI pulses alternate starting from an assumed -1 pulse.
    template <typename T>
    class LineEncoder {
        public:
            explicit LineEncoder(int samplesPerBit = DEFAULT_SAMPLES_PER_BIT)
            : samplesPerBit(samplesPerBit) {}

            // Throws ConfigurationError, InvalidInputError
            std::vector<T> encode(const std::string& bits, Scheme scheme) const;
            // Also throws UnsupportedSchemeError
            std::vector<T> encode(const std::string& bits, const std::string& scheme) const;

            int getSamplesPerBit() const { return samplesPerBit; }

        private:
            int samplesPerBit;

            // AMI family state, lives for one encode() call
            struct AmiState {
                int lastPolarity = AMI_INITIAL_POLARITY;
                unsigned int zeroRun = 0;
                unsigned int pulses = 0;
            };

            void encodeNrzL(const std::string& bits, std::vector<T>& out) const;
            void encodeNrzI(const std::string& bits, std::vector<T>& out) const;
            void encodeManchester(const std::string& bits, std::vector<T>& out) const;
            void encodeDiffManchester(const std::string& bits, std::vector<T>& out) const;
            void encodeAmi(const std::string& bits, std::vector<T>& out) const;
            void encodeB8zs(const std::string& bits, std::vector<T>& out) const;
            void encodeHdb3(const std::string& bits, std::vector<T>& out) const;

            // Emit one AMI pulse, flipping polarity
            void addPulse(std::vector<T>& out, AmiState& state) const;

            void addSamples(std::vector<T>& out, double level, size_t count) const;
            // Overwrite one already emitted cell, counting cells from the
            // start of the output
            void setCell(std::vector<T>& out, size_t cell, double level) const;
    };
}
