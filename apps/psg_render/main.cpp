// Render a tone from the AY-3-8910 emulator to a raw audio file.
// Copyright 2020 Christian Kauten
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//

#include <getopt.h>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include "psg/general_instrument_ay_3_8910.hpp"
#include "psg/math/functions.hpp"
#include "render_settings.hpp"

/// Print the usage string of the program.
static void printUsage(const char* progname) {
    std::cerr << "Usage: " << progname << " [-c clock] [-r rate] [-t ay|ym] [-f frequency] [-a amplitude]\n";
    std::cerr << "       [-n noise_period] [-e envelope_shape] [-p envelope_period] [-d seconds] [-o file]\n";
    std::cerr << "  -c: chip clock rate in Hz (default 1789772.5)\n";
    std::cerr << "  -r: output sample rate in Hz (default 44100)\n";
    std::cerr << "  -t: chip variant, ay (AY-3-8910) or ym (YM2149, default)\n";
    std::cerr << "  -f: tone frequency of channel A in Hz (default 440)\n";
    std::cerr << "  -a: amplitude of channel A in [0, 15] (default 15)\n";
    std::cerr << "  -n: mix noise into channel A with the given period in [0, 31]\n";
    std::cerr << "  -e: drive channel A with the envelope of the given shape in [0, 15]\n";
    std::cerr << "  -p: envelope period in [0, 65535]\n";
    std::cerr << "  -d: duration in seconds (default 1)\n";
    std::cerr << "  -o: output file of little-endian float32 stereo frames (default tone.raw)\n";
}

/// @brief Parse the command line into render settings.
///
/// @returns true if the settings were parsed, false if the usage was printed
/// @throws std::invalid_argument if a numeric argument cannot be parsed
/// @throws std::out_of_range if a numeric argument overflows
///
static bool parseSettings(int argc, char* argv[], RenderSettings& settings) {
    int opt;
    while ((opt = getopt(argc, argv, "c:r:t:f:a:n:e:p:d:o:h")) != -1) {
        switch (opt) {
            case 'c':
                settings.clock_rate = std::stod(optarg);
                break;
            case 'r':
                settings.set_sample_rate(optarg);
                break;
            case 't':
                if (strcmp(optarg, "ay") == 0) {
                    settings.chip_type = PSG::ChipType::AY_3_8910;
                } else if (strcmp(optarg, "ym") == 0) {
                    settings.chip_type = PSG::ChipType::YM2149;
                } else {
                    throw std::invalid_argument("unknown chip variant " + std::string(optarg));
                }
                break;
            case 'f':
                settings.frequency = std::stod(optarg);
                break;
            case 'a':
                settings.amplitude = PSG::Math::clip(std::stoi(optarg), 0, 15);
                break;
            case 'n':
                settings.noise_period = PSG::Math::clip(std::stoi(optarg), 0, 31);
                break;
            case 'e':
                settings.envelope_shape = PSG::Math::clip(std::stoi(optarg), 0, 15);
                break;
            case 'p':
                settings.envelope_period = PSG::Math::clip(std::stoi(optarg), 0, 65535);
                break;
            case 'd':
                settings.duration = std::stod(optarg);
                break;
            case 'o':
                settings.output_path = optarg;
                break;
            default:
                printUsage(argv[0]);
                return false;
        }
    }
    // reject durations that cannot be rendered before anything is written
    settings.get_frame_count();
    return true;
}

/// @brief Write a float in little-endian byte order.
///
/// @param stream the stream to write the sample to
/// @param sample the sample to write
///
static void writeSample(std::ofstream& stream, float sample) {
    uint32_t bits;
    memcpy(&bits, &sample, sizeof bits);
    const char bytes[4] = {
        static_cast<char>(bits & 0xFF),
        static_cast<char>((bits >> 8) & 0xFF),
        static_cast<char>((bits >> 16) & 0xFF),
        static_cast<char>((bits >> 24) & 0xFF)
    };
    stream.write(bytes, sizeof bytes);
}

int main(int argc, char* argv[]) {
    RenderSettings settings;
    try {
        if (!parseSettings(argc, argv, settings)) return 1;
    } catch (const std::logic_error& error) {
        std::cerr << "invalid argument: " << error.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    try {
        PSG::GeneralInstrumentAy_3_8910 apu(settings.clock_rate, settings.sample_rate, settings.chip_type);
        const uint16_t period = PSG::Math::frequency_to_tone_period(settings.frequency, settings.clock_rate);
        apu.set_tone_period(PSG::GeneralInstrumentAy_3_8910::PULSE0, period);
        apu.set_amplitude(PSG::GeneralInstrumentAy_3_8910::PULSE0, settings.amplitude);
        apu.set_tone_disabled(PSG::GeneralInstrumentAy_3_8910::PULSE0, false);
        if (settings.noise_period >= 0) {
            apu.set_noise_period(settings.noise_period);
            apu.set_noise_disabled(PSG::GeneralInstrumentAy_3_8910::PULSE0, false);
        }
        if (settings.envelope_shape >= 0) {
            apu.set_envelope_period(settings.envelope_period);
            apu.set_envelope_shape(settings.envelope_shape);
            apu.set_envelope_enabled(PSG::GeneralInstrumentAy_3_8910::PULSE0, true);
        }

        std::ofstream output(settings.output_path, std::ios::binary);
        if (!output) {
            std::cerr << "could not open " << settings.output_path << " for writing" << std::endl;
            return 1;
        }
        const uint64_t frames = settings.get_frame_count();
        for (uint64_t frame = 0; frame < frames; frame++) {
            const PSG::StereoSample sample = apu.render();
            writeSample(output, sample.left);
            writeSample(output, sample.right);
        }
        output.close();
        if (!output) {
            std::cerr << "failed to write " << settings.output_path << std::endl;
            return 1;
        }

        std::cout << "Rendered " << frames << " frames of period " << period
                  << " (" << PSG::Math::tone_period_to_frequency(period, settings.clock_rate)
                  << " Hz) to " << settings.output_path << std::endl;
    } catch (const PSG::Exception& error) {
        std::cerr << "could not initialize the chip: " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
