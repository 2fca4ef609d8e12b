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

#include <gtest/gtest.h>

#include <type_traits>
#include <vector>

using namespace Linecode;

// The view keeps a reference, so it must not bind to a temporary
static_assert(std::is_constructible<Cells<float>, const std::vector<float>&, size_t>::value, "lvalue waveform");
static_assert(!std::is_constructible<Cells<float>, std::vector<float>&&, size_t>::value, "temporary waveform");
static_assert(!std::is_constructible<Cells<double>, std::vector<double>, size_t>::value, "temporary waveform");

TEST(CellsTest, ThresholdFromPeak) {
    EXPECT_DOUBLE_EQ(magnitudeThreshold(std::vector<float>()), THRESHOLD_FLOOR);
    EXPECT_DOUBLE_EQ(magnitudeThreshold(std::vector<double>{0.1, -0.2}), THRESHOLD_FLOOR);
    EXPECT_DOUBLE_EQ(magnitudeThreshold(std::vector<double>{0.25, -4.0}), 1.0);

    std::vector<double> waveform = {0.0, 2.0};
    EXPECT_DOUBLE_EQ(Cells<double>(waveform, 2).getThreshold(), 0.5);
}

TEST(CellsTest, AveragesAndHalves) {
    std::vector<double> waveform = {-1.0, -1.0, 1.0, 1.0, 0.5, 0.5, 0.5, 0.5, 0.0};
    Cells<double> cells(waveform, 4);

    ASSERT_EQ(cells.count(), 2u);
    EXPECT_DOUBLE_EQ(cells.average(0), 0.0);
    EXPECT_DOUBLE_EQ(cells.firstHalf(0), -1.0);
    EXPECT_DOUBLE_EQ(cells.secondHalf(0), 1.0);
    EXPECT_DOUBLE_EQ(cells.average(1), 0.5);
}

TEST(CellsTest, PolarityDeadZone) {
    // Peak 2.0 puts the threshold at 0.5
    std::vector<float> waveform = {2.0f, 2.0f, 0.4f, 0.4f, -0.6f, -0.6f, -0.5f, -0.5f};
    Cells<float> cells(waveform, 2);

    ASSERT_EQ(cells.count(), 4u);
    EXPECT_EQ(cells.polarity(0), 1);
    EXPECT_EQ(cells.polarity(1), 0);
    EXPECT_EQ(cells.polarity(2), -1);
    EXPECT_EQ(cells.polarity(3), 0);
    EXPECT_TRUE(cells.isPulse(2));
    EXPECT_FALSE(cells.isPulse(1));
}
