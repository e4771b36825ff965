// Conversions between periods, frequencies, and MIDI pitches.
// Copyright 2020 Christian Kauten
//
// Author: Christian Kauten (kautenja@auburn.edu)
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

#ifndef PSG_MATH_FUNCTIONS_HPP
#define PSG_MATH_FUNCTIONS_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace PSG {

/// @brief Conversions between register values and musical units.
namespace Math {

/// the frequency of A4 (MIDI pitch 69) in Hz
static constexpr double A4_FREQUENCY = 440.0;
/// the MIDI pitch number of A4
static constexpr double A4_PITCH = 69.0;
/// the clock division of the tone generators
static constexpr double TONE_CLOCK_DIVISION = 16.0;
/// the clock division of a full cycle of the envelope generator
static constexpr double ENVELOPE_CLOCK_DIVISION = 256.0;

/// @brief Clip the given value within the given limits.
///
/// @tparam the type of values to clamp
/// @param x the value to clamp
/// @param lower the lower bound to clamp the value to
/// @param upper the upper bound to clamp the value to
/// @returns the value clamped within \f$[lower, upper]\f$
///
template <typename T>
inline T clip(const T& x, const T& lower, const T& upper) {
    return std::max(lower, std::min(x, upper));
}

/// @brief Round a real-valued period to the 16-bit period space.
///
/// @param period the real-valued period
/// @returns the period rounded and saturated to \f$[0, 65535]\f$
///
inline uint16_t to_period(double period) {
    if (std::isnan(period)) return 0;
    return static_cast<uint16_t>(clip(std::round(period), 0.0, 65535.0));
}

/// @brief Convert a MIDI pitch to a frequency.
///
/// @param pitch the MIDI pitch, which need not be an integer
/// @returns the frequency \f$440 \cdot 2^{\frac{pitch - 69}{12}}\f$ in Hz
///
inline double midi_pitch_to_frequency(double pitch) {
    return std::pow(2.0, (pitch - A4_PITCH) / 12.0) * A4_FREQUENCY;
}

/// @brief Convert a frequency to a MIDI pitch.
///
/// @param frequency the frequency in Hz
/// @returns the MIDI pitch, which need not be an integer
///
inline double frequency_to_midi_pitch(double frequency) {
    return std::log2(frequency / A4_FREQUENCY) * 12.0 + A4_PITCH;
}

/// @brief Convert a frequency to the nearest tone period.
///
/// @param frequency the frequency in Hz
/// @param clock_rate the chip clock rate in Hz
/// @returns the tone period \f$\frac{clock}{16 f}\f$ rounded to an integer
///
inline uint16_t frequency_to_tone_period(double frequency, double clock_rate) {
    return to_period(clock_rate / (TONE_CLOCK_DIVISION * frequency));
}

/// @brief Convert a frequency to the nearest envelope period.
///
/// @param frequency the frequency of a full envelope cycle in Hz
/// @param clock_rate the chip clock rate in Hz
/// @returns the envelope period \f$\frac{clock}{256 f}\f$ rounded to an integer
///
inline uint16_t frequency_to_envelope_period(double frequency, double clock_rate) {
    return to_period(clock_rate / (ENVELOPE_CLOCK_DIVISION * frequency));
}

/// @brief Convert a tone period to a frequency.
///
/// @param period the tone period
/// @param clock_rate the chip clock rate in Hz
/// @returns the frequency of the tone in Hz
///
inline double tone_period_to_frequency(uint16_t period, double clock_rate) {
    return clock_rate / (period * TONE_CLOCK_DIVISION);
}

/// @brief Convert an envelope period to a frequency.
///
/// @param period the envelope period
/// @param clock_rate the chip clock rate in Hz
/// @returns the frequency of a full envelope cycle in Hz
///
inline double envelope_period_to_frequency(uint16_t period, double clock_rate) {
    return clock_rate / (period * ENVELOPE_CLOCK_DIVISION);
}

/// @brief Convert a MIDI pitch to the nearest tone period.
inline uint16_t midi_pitch_to_tone_period(double pitch, double clock_rate) {
    return frequency_to_tone_period(midi_pitch_to_frequency(pitch), clock_rate);
}

/// @brief Convert a MIDI pitch to the nearest envelope period.
inline uint16_t midi_pitch_to_envelope_period(double pitch, double clock_rate) {
    return frequency_to_envelope_period(midi_pitch_to_frequency(pitch), clock_rate);
}

/// @brief Convert a tone period to a MIDI pitch.
inline double tone_period_to_midi_pitch(uint16_t period, double clock_rate) {
    return frequency_to_midi_pitch(tone_period_to_frequency(period, clock_rate));
}

/// @brief Convert an envelope period to a MIDI pitch.
inline double envelope_period_to_midi_pitch(uint16_t period, double clock_rate) {
    return frequency_to_midi_pitch(envelope_period_to_frequency(period, clock_rate));
}

}  // namespace Math

}  // namespace PSG

#endif  // PSG_MATH_FUNCTIONS_HPP
