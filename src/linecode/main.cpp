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
#include "config.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "exceptions.hpp"
#include "pcm.hpp"
#include "spectrum.hpp"

#include <getopt.h>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace Linecode;

static bool verbose = false;

static void usage(const char* prog) {
    std::cerr <<
        "Usage: " << prog << " [options] <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  encode <scheme> <bits>           print the waveform as 'index level' lines\n"
        "  decode <scheme> [level ...]      decode levels (or stdin lines) to bits\n"
        "  roundtrip <scheme> <bits>        encode, decode and compare\n"
        "  pcm <freq=..;amp=..;duration=..;samples=..>\n"
        "                                   PCM bitstream of a sampled sine\n"
        "  dm <freq=..;amp=..;duration=..;samples=..>\n"
        "                                   delta modulation bitstream of a sampled sine\n"
        "  spectrum <scheme> <bits>         averaged power spectrum of the encoded waveform\n"
        "\n"
        "Schemes: NRZ-L, NRZ-I, Manchester, \"Differential Manchester\", AMI, AMI-B8ZS, AMI-HDB3\n"
        "\n"
        "Options:\n"
        "  -s, --samples-per-bit N   samples per bit, even and >= 2 (default " << DEFAULT_SAMPLES_PER_BIT << ")\n"
        "  -m, --max-samples N       refuse waveforms longer than N samples (default " << DEFAULT_MAX_SAMPLES << ")\n"
        "  -b, --pcm-bits N          PCM bits per sample (default " << DEFAULT_PCM_BITS << ")\n"
        "  -f, --fft-size N          spectrum FFT size (default 256)\n"
        "  -v, --verbose             progress notes on stderr\n"
        "  -h, --help                this text\n";
}

static long parseInteger(const char* option, const char* value, long min, long max) {
    char* end = nullptr;
    errno = 0;
    long result = std::strtol(value, &end, 10);
    if (*value == '\0' || *end != '\0') {
        throw ConfigurationError(std::string("Option ") + option + " expects a number, got '" + value + "'");
    }
    if (errno == ERANGE || result < min || result > max) {
        throw ConfigurationError(std::string("Option ") + option + " is out of range: " + value);
    }
    return result;
}

static float parseLevel(const std::string& token) {
    char* end = nullptr;
    float level = std::strtof(token.c_str(), &end);
    if (token.empty() || *end != '\0' || !std::isfinite(level)) {
        throw InvalidInputError("Invalid level: '" + token + "'");
    }
    return level;
}

static std::string readBits(const std::string& text) {
    std::string bits = normalizeBits(text);
    validateBits(bits);
    return bits;
}

static std::vector<float> encodeChecked(const Config& config, const std::string& scheme, const std::string& bits) {
    checkSampleLimit(bits.size(), config.samplesPerBit, config.maxSamples);

    LineEncoder<float> encoder(config.samplesPerBit);
    std::vector<float> waveform = encoder.encode(bits, scheme);
    checkAlignment(waveform.size(), bits.size(), config.samplesPerBit);

    if (verbose) {
        std::cerr << "Encoded " << bits.size() << " bits as " << scheme << ", "
                  << waveform.size() << " samples at " << config.samplesPerBit << " samples/bit\n";
    }
    return waveform;
}

static int cmdEncode(const Config& config, const std::vector<std::string>& args) {
    if (args.size() != 2) return -1;
    std::vector<float> waveform = encodeChecked(config, args[0], readBits(args[1]));
    for (size_t i = 0; i < waveform.size(); i++) std::cout << i << " " << waveform[i] << "\n";
    return 0;
}

static int cmdDecode(const Config& config, const std::vector<std::string>& args) {
    if (args.empty()) return -1;

    std::vector<float> waveform;
    if (args.size() > 1) {
        for (size_t i = 1; i < args.size(); i++) waveform.push_back(parseLevel(args[i]));
    } else {
        // Last column of every line, so that "encode" output can be piped back in
        std::string line;
        while (std::getline(std::cin, line)) {
            std::istringstream in(line);
            std::string token, last;
            while (in >> token) last = token;
            if (!last.empty()) waveform.push_back(parseLevel(last));
        }
    }

    if (verbose) {
        std::cerr << "Decoding " << waveform.size() << " samples as " << args[0]
                  << ", threshold " << magnitudeThreshold(waveform) << "\n";
    }

    LineDecoder<float> decoder(config.samplesPerBit);
    std::cout << decoder.decode(waveform, args[0]) << "\n";
    return 0;
}

static int cmdRoundtrip(const Config& config, const std::vector<std::string>& args) {
    if (args.size() != 2) return -1;

    Scheme scheme = parseScheme(args[0]);
    std::string bits = readBits(args[1]);
    std::vector<float> waveform = encodeChecked(config, args[0], bits);
    std::string decoded = LineDecoder<float>(config.samplesPerBit).decode(waveform, scheme);

    std::cout << "Original bitstream: " << bits << "\n";
    std::cout << "Decoded bitstream:  " << decoded << "\n";

    bool match = roundTripMatches(scheme, bits, decoded);
    if (!match) std::cerr << "linecode: decoded bitstream differs from the original\n";
    return match? 0 : 1;
}

static int cmdPcm(const Config& config, const std::vector<std::string>& args) {
    if (args.size() != 1) return -1;
    AnalogSource source = parseAnalogSpec(args[0]);
    PcmEncoder pcm(source, config.pcmBits);
    std::string bits = pcm.encode();
    if (verbose) {
        std::cerr << "PCM: " << source.samples << " samples, " << config.pcmBits << " bits each\n";
    }
    std::cout << bits << "\n";
    return 0;
}

static int cmdDm(const std::vector<std::string>& args) {
    if (args.size() != 1) return -1;
    AnalogSource source = parseAnalogSpec(args[0]);
    std::cout << DeltaModulator(source).encode() << "\n";
    return 0;
}

static int cmdSpectrum(const Config& config, size_t fftSize, const std::vector<std::string>& args) {
    if (args.size() != 2) return -1;
    std::vector<float> waveform = encodeChecked(config, args[0], readBits(args[1]));

    LineSpectrum spectrum(fftSize);
    const std::vector<float>& power = spectrum.compute(waveform);
    for (size_t i = 0; i < power.size(); i++) std::cout << i << " " << power[i] << "\n";
    std::cout << "DC fraction: " << spectrum.dcFraction() << "\n";
    return 0;
}

int main(int argc, char** argv) {
    static struct option longOptions[] = {
        {"samples-per-bit", required_argument, nullptr, 's'},
        {"max-samples",     required_argument, nullptr, 'm'},
        {"pcm-bits",        required_argument, nullptr, 'b'},
        {"fft-size",        required_argument, nullptr, 'f'},
        {"verbose",         no_argument,       nullptr, 'v'},
        {"help",            no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    Config config;
    size_t fftSize = 256;

    try {
        config.loadEnvironment();

        int opt;
        while ((opt = getopt_long(argc, argv, "+s:m:b:f:vh", longOptions, nullptr)) != -1) {
            switch (opt) {
                case 's': config.samplesPerBit = (int) parseInteger("-s", optarg, INT_MIN, INT_MAX); break;
                case 'm': config.maxSamples = (size_t) parseInteger("-m", optarg, 0, LONG_MAX); break;
                case 'b': config.pcmBits = (int) parseInteger("-b", optarg, INT_MIN, INT_MAX); break;
                case 'f': fftSize = (size_t) parseInteger("-f", optarg, 0, INT_MAX); break;
                case 'v': verbose = true; break;
                case 'h': usage(argv[0]); return 0;
                default: usage(argv[0]); return 2;
            }
        }

        config.validate();

        if (optind >= argc) {
            usage(argv[0]);
            return 2;
        }

        std::string command = argv[optind];
        std::vector<std::string> args(argv + optind + 1, argv + argc);
        int result;

        if (command == "encode") {
            result = cmdEncode(config, args);
        } else if (command == "decode") {
            result = cmdDecode(config, args);
        } else if (command == "roundtrip") {
            result = cmdRoundtrip(config, args);
        } else if (command == "pcm") {
            result = cmdPcm(config, args);
        } else if (command == "dm") {
            result = cmdDm(args);
        } else if (command == "spectrum") {
            result = cmdSpectrum(config, fftSize, args);
        } else {
            std::cerr << "linecode: unknown command '" << command << "'\n";
            usage(argv[0]);
            return 2;
        }

        if (result < 0) {
            usage(argv[0]);
            return 2;
        }
        return result;
    } catch (const LinecodeError& e) {
        std::cerr << "linecode: " << e.what() << "\n";
        return 1;
    }
}
