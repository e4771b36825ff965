// A tone generator (square wave oscillator) on the AY-3-8910.
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

#ifndef PSG_GENERAL_INSTRUMENT_AY_3_8910_TONE_GENERATOR_HPP_
#define PSG_GENERAL_INSTRUMENT_AY_3_8910_TONE_GENERATOR_HPP_

#include <algorithm>
#include <cstdint>

namespace PSG {

/// @brief A square wave oscillator driven by a 12-bit period divider.
/// @details
/// The output bit toggles every `period` ticks of the chip's tick clock
/// (the master clock divided by 8), so the output frequency is
/// \f$\frac{clock}{16 \cdot period}\f$.
///
class ToneGenerator {
 private:
    /// the period of the oscillator in ticks \f$\in [1, 4095]\f$
    uint16_t period = 1;
    /// the number of ticks since the last toggle of the output
    uint16_t position = 0;
    /// the current output bit of the oscillator
    uint8_t value = 0;

 public:
    /// the bit mask for the 12-bit period
    static constexpr uint16_t PERIOD_MASK = 0x0FFF;

    /// @brief Reset the oscillator to its initial condition.
    inline void reset() {
        period = 1;
        position = 0;
        value = 0;
    }

    /// @brief Return the period of the oscillator.
    ///
    /// @returns the period \f$\in [1, 4095]\f$
    ///
    inline uint16_t get_period() const { return period; }

    /// @brief Set the period of the oscillator.
    ///
    /// @param value_ the new period. Values are wrapped to 12 bits and a
    /// period of 0 behaves like a period of 1
    ///
    inline void set_period(uint16_t value_) {
        period = std::max<uint16_t>(value_ & PERIOD_MASK, 1);
    }

    /// @brief Return the most significant byte of the period.
    ///
    /// @returns the upper 4 bits of the period \f$\in [0, 15]\f$
    ///
    inline uint8_t get_period_msb() const { return period >> 8; }

    /// @brief Set the most significant byte of the period.
    ///
    /// @param msb the upper 4 bits of the period. Values are wrapped to 4 bits
    /// @details
    /// A resulting period of 0 is set to 1, so the MSB should be written
    /// before the LSB.
    ///
    inline void set_period_msb(uint8_t msb) {
        set_period((period & 0x00FF) | ((msb & 0x0F) << 8));
    }

    /// @brief Return the least significant byte of the period.
    ///
    /// @returns the lower 8 bits of the period
    ///
    inline uint8_t get_period_lsb() const { return period & 0xFF; }

    /// @brief Set the least significant byte of the period.
    ///
    /// @param lsb the lower 8 bits of the period
    ///
    inline void set_period_lsb(uint8_t lsb) {
        set_period((period & 0x0F00) | lsb);
    }

    /// @brief Return the current output bit without advancing the oscillator.
    ///
    /// @returns the output bit \f$\in \{0, 1\}\f$
    ///
    inline uint8_t get_bit() const { return value; }

    /// @brief Advance the oscillator by a single tick.
    ///
    /// @returns the output bit after the tick \f$\in \{0, 1\}\f$
    ///
    inline uint8_t tick() {
        if (++position >= period) {
            position = 0;
            value ^= 1;
        }
        return value;
    }
};

}  // namespace PSG

#endif  // PSG_GENERAL_INSTRUMENT_AY_3_8910_TONE_GENERATOR_HPP_
