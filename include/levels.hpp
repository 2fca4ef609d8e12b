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

namespace Linecode {

    // Nominal signal levels
    const double LEVEL_HIGH = 1.0;
    const double LEVEL_LOW  = -1.0;
    const double LEVEL_ZERO = 0.0;

    // Polarity of the pulse assumed to precede every AMI stream
    const int AMI_INITIAL_POLARITY = -1;

    // Decision threshold is max(FLOOR, RATIO * peak magnitude)
    const double THRESHOLD_FLOOR = 0.05;
    const double THRESHOLD_RATIO = 0.25;

    // Sign of a level with a dead zone of +/-threshold
    inline int signOf(double value, double threshold) {
        return value > threshold? 1 : value < -threshold? -1 : 0;
    }
}
