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

#include <string>

namespace Linecode {

    enum class Scheme {
        NRZ_L,
        NRZ_I,
        MANCHESTER,
        DIFF_MANCHESTER,
        AMI,
        AMI_B8ZS,
        AMI_HDB3
    };

    const Scheme ALL_SCHEMES[] = {
        Scheme::NRZ_L,
        Scheme::NRZ_I,
        Scheme::MANCHESTER,
        Scheme::DIFF_MANCHESTER,
        Scheme::AMI,
        Scheme::AMI_B8ZS,
        Scheme::AMI_HDB3
    };

    // Display names, as accepted by parseScheme()
    const char* schemeName(Scheme scheme);

    // Throws UnsupportedSchemeError for anything not in ALL_SCHEMES
    Scheme parseScheme(const std::string& name);

    // Same as parseScheme(), but reports failure instead of throwing
    bool lookupScheme(const std::string& name, Scheme& scheme);

    // TRUE for AMI-B8ZS and AMI-HDB3
    bool isScrambled(Scheme scheme);

    // TRUE if bit 0 of a decoded stream is a convention default
    // rather than a value read from the waveform
    bool hasAmbiguousFirstBit(Scheme scheme);
}
