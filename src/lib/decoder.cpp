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
#include "unscrambler.hpp"

#include <cmath>

using namespace Linecode;

bool Linecode::isDecodeSentinel(const std::string& result) {
    return result == DECODE_EMPTY_WAVEFORM
        || result == DECODE_INVALID_SAMPLES_PER_BIT
        || result == DECODE_UNSUPPORTED;
}

bool Linecode::roundTripMatches(Scheme scheme, const std::string& bits, const std::string& decoded) {
    if (bits.empty()) return isDecodeSentinel(decoded);
    if (decoded.size() != bits.size()) return false;

    size_t from = hasAmbiguousFirstBit(scheme)? 1 : 0;
    return decoded.compare(from, std::string::npos, bits, from, std::string::npos) == 0;
}

template <typename T>
std::string LineDecoder<T>::decode(const std::vector<T>& waveform, const std::string& scheme) const {
    if (waveform.empty()) return DECODE_EMPTY_WAVEFORM;
    if (samplesPerBit <= 0) return DECODE_INVALID_SAMPLES_PER_BIT;

    Scheme s;
    if (!lookupScheme(scheme, s)) return DECODE_UNSUPPORTED;
    return decode(waveform, s);
}

template <typename T>
std::string LineDecoder<T>::decode(const std::vector<T>& waveform, Scheme scheme) const {
    if (waveform.empty()) return DECODE_EMPTY_WAVEFORM;
    if (samplesPerBit <= 0) return DECODE_INVALID_SAMPLES_PER_BIT;

    Cells<T> cells(waveform, samplesPerBit);
    std::string bits;

    switch (scheme) {
        case Scheme::NRZ_L:
            return decodeNrzL(cells);
        case Scheme::NRZ_I:
            return decodeNrzI(cells);
        case Scheme::MANCHESTER:
            return decodeManchester(cells);
        case Scheme::DIFF_MANCHESTER:
            return decodeDiffManchester(cells);
        case Scheme::AMI:
            return decodeAmi(cells);
        case Scheme::AMI_B8ZS:
            bits = decodeAmi(cells);
            B8zsUnscrambler<T>().apply(cells, bits);
            return bits;
        case Scheme::AMI_HDB3:
            bits = decodeAmi(cells);
            Hdb3Unscrambler<T>().apply(cells, bits);
            return bits;
    }

    return DECODE_UNSUPPORTED;
}

template <typename T>
std::string LineDecoder<T>::decodeNrzL(const Cells<T>& cells) const {
    std::string bits;
    bits.reserve(cells.count());
    // Near-zero cells decode as '0'
    for (size_t i = 0; i < cells.count(); i++) bits += cells.polarity(i) > 0? '1' : '0';
    return bits;
}

template <typename T>
std::string LineDecoder<T>::decodeNrzI(const Cells<T>& cells) const {
    std::string bits;
    if (!cells.count()) return bits;
    bits.reserve(cells.count());

    bits += AMBIGUOUS_BIT;
    int reference = cells.polarity(0);
    for (size_t i = 1; i < cells.count(); i++) {
        int current = cells.polarity(i);
        bits += (current && reference && current != reference)? '1' : '0';
        if (current) reference = current;
    }
    return bits;
}

template <typename T>
std::string LineDecoder<T>::decodeManchester(const Cells<T>& cells) const {
    std::string bits;
    bits.reserve(cells.count());
    double threshold = cells.getThreshold();

    for (size_t i = 0; i < cells.count(); i++) {
        double first = cells.firstHalf(i);
        double second = cells.secondHalf(i);
        if (std::fabs(second - first) > threshold) {
            // Rising edge in the middle of the cell is '1'
            bits += first < second? '1' : '0';
        } else {
            bits += cells.polarity(i) > 0? '1' : '0';
        }
    }
    return bits;
}

template <typename T>
std::string LineDecoder<T>::decodeDiffManchester(const Cells<T>& cells) const {
    std::string bits;
    if (!cells.count()) return bits;
    bits.reserve(cells.count());
    double threshold = cells.getThreshold();

    bits += AMBIGUOUS_BIT;
    int reference = signOf(cells.secondHalf(0), threshold);
    for (size_t i = 1; i < cells.count(); i++) {
        // No transition at the cell boundary is '1'
        bits += signOf(cells.firstHalf(i), threshold) == reference? '1' : '0';
        reference = signOf(cells.secondHalf(i), threshold);
    }
    return bits;
}

template <typename T>
std::string LineDecoder<T>::decodeAmi(const Cells<T>& cells) const {
    std::string bits;
    bits.reserve(cells.count());
    for (size_t i = 0; i < cells.count(); i++) bits += cells.isPulse(i)? '1' : '0';
    return bits;
}

namespace Linecode {
    template class LineDecoder<float>;
    template class LineDecoder<double>;
}
