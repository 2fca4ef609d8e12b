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

#include "unscrambler.hpp"

#include <algorithm>

using namespace Linecode;

template <typename T>
void Unscrambler<T>::apply(const Cells<T>& cells, std::string& bits) const {
    size_t length = std::min(bits.size(), cells.count());
    int reference = AMI_INITIAL_POLARITY;
    size_t i = 0;

    while (i + window <= length) {
        if (matches(cells, bits, i, reference)) {
            for (size_t j = i; j < i + window; j++) {
                int p = cells.polarity(j);
                if (p) reference = p;
            }
            std::fill(bits.begin() + i, bits.begin() + i + window, '0');
            i += window;
        } else {
            int p = cells.polarity(i);
            if (p) reference = p;
            i++;
        }
    }
}

template <typename T>
bool B8zsUnscrambler<T>::matches(const Cells<T>& cells, const std::string& bits, size_t start, int reference) const {
    if (bits.compare(start, 8, "00011011") != 0) return false;

    // Violation signature relative to the preceding pulse
    return cells.polarity(start + 3) == reference
        && cells.polarity(start + 4) == -reference
        && cells.polarity(start + 6) == reference
        && cells.polarity(start + 7) == -reference;
}

template <typename T>
bool Hdb3Unscrambler<T>::matches(const Cells<T>& cells, const std::string& bits, size_t start, int reference) const {
    int v = cells.polarity(start + 3);

    // 000V, V repeats the preceding pulse
    if (bits.compare(start, 4, "0001") == 0) {
        return v == reference;
    }

    // B00V, B alternates normally and V repeats B
    if (bits.compare(start, 4, "1001") == 0) {
        int b = cells.polarity(start);
        return b == -reference && v == b;
    }

    return false;
}

namespace Linecode {
    template class Unscrambler<float>;
    template class Unscrambler<double>;
    template class B8zsUnscrambler<float>;
    template class B8zsUnscrambler<double>;
    template class Hdb3Unscrambler<float>;
    template class Hdb3Unscrambler<double>;
}
