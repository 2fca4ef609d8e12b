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
#include <vector>

namespace Linecode {

    const int PCM_MAX_BITS = 16;

    // A sine wave amp*sin(2*pi*freq*t), sampled `samples` times over
    // `duration` seconds. Feeds the PCM and delta modulation front-ends.
    struct AnalogSource {
        double freq = 1.0;       // Hz
        double amp = 1.0;        // peak amplitude
        double duration = 1.0;   // seconds
        int samples = 50;

        double sampleAt(int index) const;
    };

    // Parse "freq=1;amp=1;duration=1;samples=50". Missing keys keep their
    // defaults, unknown keys and items without '=' are skipped.
    // Throws InvalidInputError on unparsable numbers.
    AnalogSource parseAnalogSpec(const std::string& spec);

    class PcmEncoder {
        public:
            // Throws InvalidInputError on non-positive or non-finite parameters
            PcmEncoder(const AnalogSource& source, int bits);

            // Quantization indices as MSB-first binary words, bits digits each
            std::string encode() const;
            // Quantized level of every sample
            std::vector<double> quantized() const;

        private:
            AnalogSource source;
            int bits;
            int levels;
            double step;

            int quantize(double value) const;
    };

    class DeltaModulator {
        public:
            // Step defaults to amp / 16
            explicit DeltaModulator(const AnalogSource& source);
            // Throws InvalidInputError on non-positive or non-finite parameters
            DeltaModulator(const AnalogSource& source, double step);

            // One bit per sample: '1' steps the estimate up, '0' steps it down
            std::string encode() const;

        private:
            AnalogSource source;
            double step;
    };
}
