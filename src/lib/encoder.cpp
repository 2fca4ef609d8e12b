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

#include "encoder.hpp"
#include "bitstream.hpp"
#include "exceptions.hpp"

#include <stdexcept>

using namespace Linecode;

// B8ZS replaces 8 zeros with 000VB0VB
#define LINECODE_B8ZS_RUN 8
#define LINECODE_B8ZS_POS_V1 3
#define LINECODE_B8ZS_POS_B1 4
#define LINECODE_B8ZS_POS_V2 6
#define LINECODE_B8ZS_POS_B2 7

// HDB3 replaces 4 zeros with B00V or 000V
#define LINECODE_HDB3_RUN 4

template <typename T>
std::vector<T> LineEncoder<T>::encode(const std::string& bits, const std::string& scheme) const {
    return encode(bits, parseScheme(scheme));
}

template <typename T>
std::vector<T> LineEncoder<T>::encode(const std::string& bits, Scheme scheme) const {
    if (!Config::isValidSamplesPerBit(samplesPerBit)) {
        throw ConfigurationError(
            "SAMPLES_PER_BIT must be even and >=2. Current: " + std::to_string(samplesPerBit)
        );
    }
    validateBits(bits);

    std::vector<T> out;
    out.reserve(bits.size() * samplesPerBit);

    switch (scheme) {
        case Scheme::NRZ_L:           encodeNrzL(bits, out); break;
        case Scheme::NRZ_I:           encodeNrzI(bits, out); break;
        case Scheme::MANCHESTER:      encodeManchester(bits, out); break;
        case Scheme::DIFF_MANCHESTER: encodeDiffManchester(bits, out); break;
        case Scheme::AMI:             encodeAmi(bits, out); break;
        case Scheme::AMI_B8ZS:        encodeB8zs(bits, out); break;
        case Scheme::AMI_HDB3:        encodeHdb3(bits, out); break;
    }

    return out;
}

template <typename T>
void LineEncoder<T>::addSamples(std::vector<T>& out, double level, size_t count) const {
    out.insert(out.end(), count, (T) level);
}

template <typename T>
void LineEncoder<T>::setCell(std::vector<T>& out, size_t cell, double level) const {
    size_t start = cell * samplesPerBit;
    if (start + samplesPerBit > out.size()) {
        throw std::out_of_range(
            "Cell " + std::to_string(cell) + " out of range, size=" + std::to_string(out.size())
        );
    }
    for (size_t i = 0; i < (size_t) samplesPerBit; i++) out[start + i] = (T) level;
}

template <typename T>
void LineEncoder<T>::encodeNrzL(const std::string& bits, std::vector<T>& out) const {
    for (char c : bits) addSamples(out, c == '1'? LEVEL_HIGH : LEVEL_LOW, samplesPerBit);
}

template <typename T>
void LineEncoder<T>::encodeNrzI(const std::string& bits, std::vector<T>& out) const {
    double level = LEVEL_LOW;
    for (char c : bits) {
        if (c == '1') level = -level;
        addSamples(out, level, samplesPerBit);
    }
}

template <typename T>
void LineEncoder<T>::encodeManchester(const std::string& bits, std::vector<T>& out) const {
    size_t half = samplesPerBit / 2;
    for (char c : bits) {
        double first = c == '1'? LEVEL_LOW : LEVEL_HIGH;
        addSamples(out, first, half);
        addSamples(out, -first, samplesPerBit - half);
    }
}

template <typename T>
void LineEncoder<T>::encodeDiffManchester(const std::string& bits, std::vector<T>& out) const {
    size_t half = samplesPerBit / 2;
    double level = LEVEL_LOW;
    for (char c : bits) {
        // Transition at the start of the cell encodes '0'
        if (c == '0') level = -level;
        addSamples(out, level, half);
        // Mandatory mid-cell transition
        level = -level;
        addSamples(out, level, samplesPerBit - half);
    }
}

template <typename T>
void LineEncoder<T>::addPulse(std::vector<T>& out, AmiState& state) const {
    state.lastPolarity = -state.lastPolarity;
    state.zeroRun = 0;
    state.pulses++;
    addSamples(out, (double) state.lastPolarity, samplesPerBit);
}

template <typename T>
void LineEncoder<T>::encodeAmi(const std::string& bits, std::vector<T>& out) const {
    AmiState state;
    for (char c : bits) {
        if (c == '1') addPulse(out, state);
        else addSamples(out, LEVEL_ZERO, samplesPerBit);
    }
}

template <typename T>
void LineEncoder<T>::encodeB8zs(const std::string& bits, std::vector<T>& out) const {
    AmiState state;
    size_t cell = 0;

    for (char c : bits) {
        if (c == '1') {
            addPulse(out, state);
        } else {
            addSamples(out, LEVEL_ZERO, samplesPerBit);
            if (++state.zeroRun == LINECODE_B8ZS_RUN) {
                size_t start = cell + 1 - LINECODE_B8ZS_RUN;
                double v = state.lastPolarity;

                // V repeats the last pulse polarity, B alternates after it
                setCell(out, start + LINECODE_B8ZS_POS_V1, v);
                setCell(out, start + LINECODE_B8ZS_POS_B1, -v);
                setCell(out, start + LINECODE_B8ZS_POS_V2, v);
                setCell(out, start + LINECODE_B8ZS_POS_B2, -v);

                state.lastPolarity = -state.lastPolarity;
                state.zeroRun = 0;
            }
        }
        cell++;
    }
}

template <typename T>
void LineEncoder<T>::encodeHdb3(const std::string& bits, std::vector<T>& out) const {
    AmiState state;
    size_t cell = 0;

    for (char c : bits) {
        if (c == '1') {
            addPulse(out, state);
        } else {
            addSamples(out, LEVEL_ZERO, samplesPerBit);
            if (++state.zeroRun == LINECODE_HDB3_RUN) {
                size_t start = cell + 1 - LINECODE_HDB3_RUN;

                if ((state.pulses % 2) == 0) {
                    // B00V: B keeps AMI alternation, V repeats B
                    int b = -state.lastPolarity;
                    setCell(out, start, b);
                    setCell(out, start + 3, b);
                    state.lastPolarity = b;
                } else {
                    // 000V: V repeats the last pulse
                    setCell(out, start + 3, state.lastPolarity);
                }

                state.zeroRun = 0;
                state.pulses = 0;
            }
        }
        cell++;
    }
}

namespace Linecode {
    template class LineEncoder<float>;
    template class LineEncoder<double>;
}
