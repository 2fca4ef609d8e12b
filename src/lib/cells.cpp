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

#include "cells.hpp"

#include <algorithm>
#include <cmath>

using namespace Linecode;

template <typename T>
double Linecode::magnitudeThreshold(const std::vector<T>& waveform) {
    double maxAbs = 0.0;
    for (const T& v : waveform) maxAbs = std::max(maxAbs, (double) std::fabs(v));
    return std::max(THRESHOLD_FLOOR, maxAbs * THRESHOLD_RATIO);
}

template <typename T>
Cells<T>::Cells(const std::vector<T>& waveform, size_t samplesPerBit):
    waveform(waveform),
    samplesPerBit(samplesPerBit),
    half(std::max<size_t>(1, samplesPerBit / 2)),
    cells(samplesPerBit? waveform.size() / samplesPerBit : 0),
    threshold(magnitudeThreshold(waveform))
{}

template <typename T>
double Cells<T>::mean(size_t from, size_t to) const {
    to = std::min(to, waveform.size());
    if (from >= to) return 0.0;

    double sum = 0.0;
    for (size_t i = from; i < to; i++) sum += waveform[i];
    return sum / (to - from);
}

template <typename T>
double Cells<T>::average(size_t cell) const {
    size_t start = cell * samplesPerBit;
    return mean(start, start + samplesPerBit);
}

template <typename T>
double Cells<T>::firstHalf(size_t cell) const {
    size_t start = cell * samplesPerBit;
    return mean(start, start + half);
}

template <typename T>
double Cells<T>::secondHalf(size_t cell) const {
    size_t start = cell * samplesPerBit;
    return mean(start + half, start + samplesPerBit);
}

template <typename T>
int Cells<T>::polarity(size_t cell) const {
    return signOf(average(cell), threshold);
}

namespace Linecode {
    template double magnitudeThreshold(const std::vector<float>& waveform);
    template double magnitudeThreshold(const std::vector<double>& waveform);
    template class Cells<float>;
    template class Cells<double>;
}
