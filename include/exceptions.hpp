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

#include <stdexcept>
#include <string>

namespace Linecode {

    class LinecodeError: public std::runtime_error {
        public:
            explicit LinecodeError(const std::string& msg): std::runtime_error(msg) {}
    };

    // invalid samples-per-bit or any other broken process-wide setting
    class ConfigurationError: public LinecodeError {
        public:
            explicit ConfigurationError(const std::string& msg): LinecodeError(msg) {}
    };

    // non-binary bitstreams, non-positive front-end parameters
    class InvalidInputError: public LinecodeError {
        public:
            explicit InvalidInputError(const std::string& msg): LinecodeError(msg) {}
    };

    class UnsupportedSchemeError: public LinecodeError {
        public:
            explicit UnsupportedSchemeError(const std::string& scheme):
                LinecodeError("Unknown encoding scheme: " + scheme),
                scheme(scheme)
            {}

            const std::string& getScheme() const { return scheme; }

        private:
            std::string scheme;
    };
}
