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

#include "config.hpp"
#include "exceptions.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>

using namespace Linecode;

bool Config::isValidSamplesPerBit(int samplesPerBit) {
    return samplesPerBit >= 2 && (samplesPerBit % 2) == 0;
}

void Config::loadEnvironment() {
    const char* value = std::getenv(SAMPLES_PER_BIT_ENV);
    if (value == nullptr || *value == '\0') return;

    char* end = nullptr;
    errno = 0;
    long spb = std::strtol(value, &end, 10);
    if (errno || *end != '\0' || spb < INT_MIN || spb > INT_MAX) {
        throw ConfigurationError(std::string(SAMPLES_PER_BIT_ENV) + " is not a number: " + value);
    }
    samplesPerBit = (int) spb;
}

void Config::validate() const {
    if (!isValidSamplesPerBit(samplesPerBit)) {
        throw ConfigurationError(
            "SAMPLES_PER_BIT must be even and >=2. Current: " + std::to_string(samplesPerBit)
        );
    }
    if (maxSamples == 0) {
        throw ConfigurationError("Sample limit must be positive");
    }
    if (pcmBits <= 0 || pcmBits > 16) {
        throw ConfigurationError("PCM bit depth must be within 1..16. Current: " + std::to_string(pcmBits));
    }
}
