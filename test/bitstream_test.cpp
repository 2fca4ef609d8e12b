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

#include "bitstream.hpp"
#include "exceptions.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace Linecode;

TEST(BitstreamTest, NormalizeDropsSeparators) {
    EXPECT_EQ(normalizeBits("1 0,1\n1"), "1011");
    EXPECT_EQ(normalizeBits("\t,, "), "");
    EXPECT_EQ(normalizeBits("10x1"), "10x1");
}

TEST(BitstreamTest, ValidateAcceptsBinary) {
    EXPECT_NO_THROW(validateBits(""));
    EXPECT_NO_THROW(validateBits("0110100"));
}

TEST(BitstreamTest, ValidateNamesOffendingSymbol) {
    try {
        validateBits("0102");
        FAIL() << "expected InvalidInputError";
    } catch (const InvalidInputError& e) {
        EXPECT_NE(std::string(e.what()).find("'2' at position 3"), std::string::npos) << e.what();
    }
}

TEST(BitstreamTest, Alignment) {
    EXPECT_NO_THROW(checkAlignment(12, 3, 4));
    EXPECT_NO_THROW(checkAlignment(0, 0, 2));
    EXPECT_THROW(checkAlignment(11, 3, 4), ConfigurationError);
    EXPECT_THROW(checkAlignment(0, 0, 0), ConfigurationError);
}

TEST(BitstreamTest, SampleLimit) {
    EXPECT_NO_THROW(checkSampleLimit(5, 4, 20));
    EXPECT_NO_THROW(checkSampleLimit(0, 4, 0));
    EXPECT_THROW(checkSampleLimit(4, 4, 8), InvalidInputError);
    EXPECT_THROW(checkSampleLimit(5001, 4, 20000), InvalidInputError);

    try {
        checkSampleLimit(3, 4, 8);
        FAIL() << "expected InvalidInputError";
    } catch (const InvalidInputError& e) {
        EXPECT_NE(std::string(e.what()).find("generate 12 samples, more than the limit of 8"), std::string::npos) << e.what();
    }
}
