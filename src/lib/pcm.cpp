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

#include "pcm.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>

using namespace Linecode;

double AnalogSource::sampleAt(int index) const {
    double fs = samples / duration;
    return amp * std::sin(2.0 * M_PI * freq * index / fs);
}

static std::string trim(const std::string& s) {
    size_t from = s.find_first_not_of(" \t\r\n");
    if (from == std::string::npos) return "";
    size_t to = s.find_last_not_of(" \t\r\n");
    return s.substr(from, to - from + 1);
}

// Rejects NaN and infinities as well as non-positive values
static bool isValidSource(const AnalogSource& source) {
    return std::isfinite(source.freq) && std::isfinite(source.amp) && std::isfinite(source.duration)
        && source.samples > 0 && source.duration > 0 && source.amp > 0;
}

static double parseNumber(const std::string& key, const std::string& value) {
    char* end = nullptr;
    double result = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0' || !std::isfinite(result)) {
        throw InvalidInputError("Invalid value for " + key + ": '" + value + "'. Use format: freq=1;amp=1;duration=1;samples=50");
    }
    return result;
}

AnalogSource Linecode::parseAnalogSpec(const std::string& spec) {
    AnalogSource source;
    std::istringstream in(spec);
    std::string item;

    while (std::getline(in, item, ';')) {
        size_t eq = item.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(item.substr(0, eq));
        std::string value = trim(item.substr(eq + 1));

        if (key == "freq") {
            source.freq = parseNumber(key, value);
        } else if (key == "amp") {
            source.amp = parseNumber(key, value);
        } else if (key == "duration") {
            source.duration = parseNumber(key, value);
        } else if (key == "samples") {
            double samples = parseNumber(key, value);
            if (samples != std::floor(samples) || samples < INT_MIN || samples > INT_MAX) {
                throw InvalidInputError("Invalid value for samples: '" + value + "'");
            }
            source.samples = (int) samples;
        }
    }

    return source;
}

PcmEncoder::PcmEncoder(const AnalogSource& source, int bits):
    source(source),
    bits(bits)
{
    if (!isValidSource(source) || bits <= 0) {
        throw InvalidInputError("Invalid PCM parameters: samples,duration,nBits,amp must be > 0");
    }
    if (bits > PCM_MAX_BITS) {
        throw InvalidInputError("Invalid PCM parameters: nBits must be <= " + std::to_string(PCM_MAX_BITS));
    }
    levels = 1 << bits;
    step = 2.0 * source.amp / (levels - 1);
}

int PcmEncoder::quantize(double value) const {
    int index = (int) std::lround((value + source.amp) / step);
    return std::max(0, std::min(index, levels - 1));
}

std::string PcmEncoder::encode() const {
    std::string out;
    out.reserve((size_t) source.samples * bits);

    for (int i = 0; i < source.samples; i++) {
        int index = quantize(source.sampleAt(i));
        for (int b = bits - 1; b >= 0; b--) out += ((index >> b) & 1)? '1' : '0';
    }
    return out;
}

std::vector<double> PcmEncoder::quantized() const {
    std::vector<double> out;
    out.reserve(source.samples);
    for (int i = 0; i < source.samples; i++) {
        out.push_back(-source.amp + quantize(source.sampleAt(i)) * step);
    }
    return out;
}

DeltaModulator::DeltaModulator(const AnalogSource& source):
    DeltaModulator(source, source.amp / 16.0)
{}

DeltaModulator::DeltaModulator(const AnalogSource& source, double step):
    source(source),
    step(step)
{
    if (!isValidSource(source)) {
        throw InvalidInputError("Invalid DM parameters: samples,duration,amp must be > 0");
    }
    if (!std::isfinite(step) || step <= 0) {
        throw InvalidInputError("Delta mod step must be > 0");
    }
}

std::string DeltaModulator::encode() const {
    std::string out;
    out.reserve(source.samples);
    double estimate = 0.0;

    for (int i = 0; i < source.samples; i++) {
        if (source.sampleAt(i) >= estimate) {
            out += '1';
            estimate += step;
        } else {
            out += '0';
            estimate -= step;
        }
        estimate = std::max(-source.amp, std::min(source.amp, estimate));
    }
    return out;
}
