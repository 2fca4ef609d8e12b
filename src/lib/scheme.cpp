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

#include "scheme.hpp"
#include "exceptions.hpp"

using namespace Linecode;

const char* Linecode::schemeName(Scheme scheme) {
    switch (scheme) {
        case Scheme::NRZ_L:           return "NRZ-L";
        case Scheme::NRZ_I:           return "NRZ-I";
        case Scheme::MANCHESTER:      return "Manchester";
        case Scheme::DIFF_MANCHESTER: return "Differential Manchester";
        case Scheme::AMI:             return "AMI";
        case Scheme::AMI_B8ZS:        return "AMI-B8ZS";
        case Scheme::AMI_HDB3:        return "AMI-HDB3";
    }
    return "";
}

bool Linecode::lookupScheme(const std::string& name, Scheme& scheme) {
    for (Scheme s : ALL_SCHEMES) {
        if (name == schemeName(s)) {
            scheme = s;
            return true;
        }
    }
    return false;
}

Scheme Linecode::parseScheme(const std::string& name) {
    Scheme scheme;
    if (!lookupScheme(name, scheme)) {
        throw UnsupportedSchemeError(name);
    }
    return scheme;
}

bool Linecode::isScrambled(Scheme scheme) {
    return scheme == Scheme::AMI_B8ZS || scheme == Scheme::AMI_HDB3;
}

bool Linecode::hasAmbiguousFirstBit(Scheme scheme) {
    return scheme == Scheme::NRZ_I || scheme == Scheme::DIFF_MANCHESTER;
}
