// A channel (voice) on the AY-3-8910.
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

#ifndef PSG_GENERAL_INSTRUMENT_AY_3_8910_CHANNEL_HPP_
#define PSG_GENERAL_INSTRUMENT_AY_3_8910_CHANNEL_HPP_

#include <cmath>
#include <cstdint>
#include "tone_generator.hpp"

namespace PSG {

/// @brief One of the three channels of the chip.
/// @details
/// A channel gates its square wave with the shared noise generator (either
/// of which can be switched off) and scales the result by a fixed 4-bit
/// amplitude or by the shared envelope generator.
///
class Channel {
 private:
    /// the square wave oscillator of the channel
    ToneGenerator tone;

    /// whether the tone is switched off in the mixer
    bool tone_off = true;
    /// whether the noise is switched off in the mixer
    bool noise_off = true;
    /// whether the envelope generator controls the amplitude
    bool envelope_on = false;
    /// the fixed 4-bit amplitude of the channel
    uint8_t amplitude = 0;

    /// the gain applied to the left output
    double pan_left = 0.5;
    /// the gain applied to the right output
    double pan_right = 0.5;

 public:
    /// the bit in the amplitude register that enables the envelope
    static constexpr uint8_t ENVELOPE_ENABLE = 0x10;

    /// @brief Reset the channel to its initial condition.
    inline void reset() {
        tone.reset();
        tone_off = true;
        noise_off = true;
        envelope_on = false;
        amplitude = 0;
        pan_left = 0.5;
        pan_right = 0.5;
    }

    /// @brief Return the tone generator of the channel.
    inline const ToneGenerator& get_tone() const { return tone; }

    /// @brief Return the period of the tone \f$\in [1, 4095]\f$.
    inline uint16_t get_period() const { return tone.get_period(); }

    /// @brief Set the period of the tone.
    ///
    /// @param period the 12-bit period, where 0 behaves like 1
    ///
    inline void set_period(uint16_t period) { tone.set_period(period); }

    /// @brief Return the upper 4 bits of the tone period.
    inline uint8_t get_period_msb() const { return tone.get_period_msb(); }

    /// @brief Set the upper 4 bits of the tone period.
    inline void set_period_msb(uint8_t msb) { tone.set_period_msb(msb); }

    /// @brief Return the lower 8 bits of the tone period.
    inline uint8_t get_period_lsb() const { return tone.get_period_lsb(); }

    /// @brief Set the lower 8 bits of the tone period.
    inline void set_period_lsb(uint8_t lsb) { tone.set_period_lsb(lsb); }

    /// @brief Return the fixed amplitude \f$\in [0, 15]\f$.
    inline uint8_t get_amplitude() const { return amplitude; }

    /// @brief Set the fixed amplitude.
    ///
    /// @param value the amplitude. Values are wrapped to 4 bits
    ///
    inline void set_amplitude(uint8_t value) { amplitude = value & 0x0F; }

    /// @brief Return whether the envelope controls the amplitude.
    inline bool is_envelope_enabled() const { return envelope_on; }

    /// @brief Set whether the envelope controls the amplitude.
    inline void set_envelope_enabled(bool enabled) { envelope_on = enabled; }

    /// @brief Return the amplitude register of the channel.
    ///
    /// @returns the amplitude in bits 0-3 and the envelope enable in bit 4
    ///
    inline uint8_t get_amplitude_register() const {
        return (envelope_on ? ENVELOPE_ENABLE : 0) | amplitude;
    }

    /// @brief Write the amplitude register of the channel.
    ///
    /// @param value the amplitude in bits 0-3 and the envelope enable in bit 4
    ///
    inline void set_amplitude_register(uint8_t value) {
        amplitude = value & 0x0F;
        envelope_on = value & ENVELOPE_ENABLE;
    }

    /// @brief Return whether the tone is switched off in the mixer.
    inline bool is_tone_disabled() const { return tone_off; }

    /// @brief Set whether the tone is switched off in the mixer.
    inline void set_tone_disabled(bool disabled) { tone_off = disabled; }

    /// @brief Return whether the noise is switched off in the mixer.
    inline bool is_noise_disabled() const { return noise_off; }

    /// @brief Set whether the noise is switched off in the mixer.
    inline void set_noise_disabled(bool disabled) { noise_off = disabled; }

    /// @brief Return the gain applied to the left output.
    inline double get_pan_left() const { return pan_left; }

    /// @brief Return the gain applied to the right output.
    inline double get_pan_right() const { return pan_right; }

    /// @brief Set the stereo panning of the channel.
    ///
    /// @param balance the balance \f$\in [0, 1]\f$ from full left to full right
    /// @param equal_power true to treat the balance as a ratio of power
    /// instead of amplitude, i.e., to take the square root of both gains
    ///
    inline void set_panning(double balance, bool equal_power = false) {
        pan_left = 1.0 - balance;
        pan_right = balance;
        if (equal_power) {
            pan_left = std::sqrt(pan_left);
            pan_right = std::sqrt(pan_right);
        }
    }

    /// @brief Return the DAC level of the channel for given generator outputs.
    ///
    /// @param tone_bit the output bit of the channel's tone generator
    /// @param noise_bit the output bit of the shared noise generator
    /// @param envelope the output level of the shared envelope generator
    /// @returns the 5-bit DAC level \f$\in [0, 31]\f$
    /// @details
    /// A 4-bit amplitude \f$a\f$ maps to the 5-bit level \f$2a + 1\f$.
    ///
    inline uint8_t get_level(uint8_t tone_bit, uint8_t noise_bit, uint8_t envelope) const {
        const uint8_t gate = (tone_bit | tone_off) & (noise_bit | noise_off);
        return gate * (envelope_on ? envelope : amplitude * 2 + 1);
    }

    /// @brief Advance the tone generator by a single tick.
    ///
    /// @param noise_bit the output bit of the shared noise generator
    /// @param envelope the output level of the shared envelope generator
    /// @returns the 5-bit DAC level \f$\in [0, 31]\f$ after the tick
    ///
    inline uint8_t tick(uint8_t noise_bit, uint8_t envelope) {
        return get_level(tone.tick(), noise_bit, envelope);
    }
};

}  // namespace PSG

#endif  // PSG_GENERAL_INSTRUMENT_AY_3_8910_CHANNEL_HPP_
