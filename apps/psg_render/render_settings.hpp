// Settings of the tone renderer and their validation.
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

#ifndef PSG_RENDER_RENDER_SETTINGS_HPP_
#define PSG_RENDER_RENDER_SETTINGS_HPP_

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include "psg/general_instrument_ay_3_8910.hpp"

/// The settings for a render, filled in from the command line.
struct RenderSettings {
    /// the largest number of frames that can be rendered
    static constexpr uint64_t MAX_FRAMES = std::numeric_limits<uint32_t>::max();

    /// the chip clock rate in Hz (MSX)
    double clock_rate = 1789772.5;
    /// the output sample rate in Hz
    unsigned sample_rate = 44100;
    /// the chip variant to emulate
    PSG::ChipType chip_type = PSG::ChipType::YM2149;
    /// the frequency of the tone on channel A in Hz
    double frequency = 440.0;
    /// the fixed amplitude of channel A
    uint8_t amplitude = 15;
    /// the noise period, or -1 to leave the noise off
    int noise_period = -1;
    /// the envelope shape, or -1 to use the fixed amplitude
    int envelope_shape = -1;
    /// the envelope period
    uint16_t envelope_period = 0;
    /// the length of the render in seconds
    double duration = 1.0;
    /// the path of the output file
    std::string output_path = "tone.raw";

    /// @brief Parse and set the sample rate.
    ///
    /// @param text the decimal sample rate in Hz
    /// @throws std::invalid_argument if the text is not a number
    /// @throws std::out_of_range if the rate is negative or does not fit in
    /// an unsigned integer
    ///
    void set_sample_rate(const std::string& text) {
        if (text.find('-') != std::string::npos)
            throw std::out_of_range("sample rate must not be negative");
        const unsigned long value = std::stoul(text);
        if (value > std::numeric_limits<unsigned>::max())
            throw std::out_of_range("sample rate " + text + " is too large");
        sample_rate = static_cast<unsigned>(value);
    }

    /// @brief Return the number of frames to render.
    ///
    /// @returns the duration in samples, rounded down
    /// @throws std::invalid_argument if the duration is negative or not finite
    /// @throws std::out_of_range if the render is longer than `MAX_FRAMES`
    ///
    uint64_t get_frame_count() const {
        if (!std::isfinite(duration) || duration < 0)
            throw std::invalid_argument("duration must be a non-negative, finite number");
        const double frames = duration * sample_rate;
        if (frames > static_cast<double>(MAX_FRAMES))
            throw std::out_of_range("duration of " + std::to_string(duration) + "s is too long");
        return static_cast<uint64_t>(frames);
    }
};

#endif  // PSG_RENDER_RENDER_SETTINGS_HPP_
