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

#include <cstddef>

namespace Linecode {

    const int DEFAULT_SAMPLES_PER_BIT = 4;
    const size_t DEFAULT_MAX_SAMPLES = 20000;
    const int DEFAULT_PCM_BITS = 8;

    // Environment override for samplesPerBit
    const char SAMPLES_PER_BIT_ENV[] = "LINECODE_SAMPLES_PER_BIT";

    // Process-wide settings. Filled once at startup (defaults, then
    // environment, then command line), validated, then only read.
    struct Config {
        int samplesPerBit = DEFAULT_SAMPLES_PER_BIT;
        size_t maxSamples = DEFAULT_MAX_SAMPLES;
        int pcmBits = DEFAULT_PCM_BITS;

        // Throws ConfigurationError if the variable is set but not a number
        void loadEnvironment();

        // Throws ConfigurationError on the first invalid setting
        void validate() const;

        // Cells are split in two halves, so samplesPerBit must be even and >= 2
        static bool isValidSamplesPerBit(int samplesPerBit);
    };
}
