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

#include "levels.hpp"

#include <vector>
#include <cstddef>

namespace Linecode {

    // Peak-relative decision threshold for a whole waveform
    template <typename T>
    double magnitudeThreshold(const std::vector<T>& waveform);

    // Read-only view of a waveform as a sequence of bit cells. All
    // decisions are taken on cell (or half-cell) averages, compared
    // against a threshold computed once from the waveform peak.
    // The waveform is referenced, not copied, and must outlive the view.
    template <typename T>
    class Cells {
        public:
            Cells(const std::vector<T>& waveform, size_t samplesPerBit);
            Cells(std::vector<T>&& waveform, size_t samplesPerBit) = delete;

            // Number of complete cells, trailing partial cell ignored
            size_t count() const { return cells; }
            double getThreshold() const { return threshold; }

            double average(size_t cell) const;
            double firstHalf(size_t cell) const;
            double secondHalf(size_t cell) const;

            // -1, 0 or +1 with the threshold dead zone applied
            int polarity(size_t cell) const;
            bool isPulse(size_t cell) const { return polarity(cell) != 0; }

        private:
            const std::vector<T>& waveform;
            size_t samplesPerBit;
            size_t half;
            size_t cells;
            double threshold;

            double mean(size_t from, size_t to) const;
    };
}
