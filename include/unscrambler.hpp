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

#include "cells.hpp"

#include <string>
#include <cstddef>

namespace Linecode {

    // Second decoding pass for the scrambled AMI schemes. Scans an AMI
    // decoded bitstream for substitution blocks, confirms each candidate
    // by its polarity violations on the waveform itself, and zeroes the
    // block. Matching is greedy: the first matching window wins and the
    // scan resumes after it.
    template <typename T>
    class Unscrambler {
        public:
            explicit Unscrambler(size_t window): window(window) {}
            virtual ~Unscrambler() = default;

            // bits[i] must be the AMI decision for cells[i]
            void apply(const Cells<T>& cells, std::string& bits) const;

            size_t getWindow() const { return window; }

        protected:
            // Reference is the polarity of the last pulse before start
            virtual bool matches(const Cells<T>& cells, const std::string& bits, size_t start, int reference) const = 0;

        private:
            size_t window;
    };

    // 000VB0VB
    template <typename T>
    class B8zsUnscrambler: public Unscrambler<T> {
        public:
            B8zsUnscrambler(): Unscrambler<T>(8) {}

        protected:
            bool matches(const Cells<T>& cells, const std::string& bits, size_t start, int reference) const override;
    };

    // 000V or B00V
    template <typename T>
    class Hdb3Unscrambler: public Unscrambler<T> {
        public:
            Hdb3Unscrambler(): Unscrambler<T>(4) {}

        protected:
            bool matches(const Cells<T>& cells, const std::string& bits, size_t start, int reference) const override;
    };
}
