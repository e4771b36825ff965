// The noise generator on the AY-3-8910.
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

#ifndef PSG_GENERAL_INSTRUMENT_AY_3_8910_NOISE_GENERATOR_HPP_
#define PSG_GENERAL_INSTRUMENT_AY_3_8910_NOISE_GENERATOR_HPP_

#include <algorithm>
#include <cstdint>

namespace PSG {

/// @brief A 17-bit linear feedback shift register with taps at bits 13 and
/// 16, shared by all three channels.
/// @details
/// The register is updated once every `2 * period` ticks. It is computed in
/// Galois form, which is cheaper than the Fibonacci form of the hardware but
/// lags it by a few steps, so the power-on seed is chosen to line the two
/// sequences up.
///
class NoiseGenerator {
 private:
    /// the period of the generator \f$\in [1, 31]\f$
    uint8_t period = 1;
    /// the number of ticks since the last shift of the register
    uint8_t counter = 0;
    /// the state of the shift register
    uint32_t lfsr = SEED;

 public:
    /// the value of the shift register at power on
    static constexpr uint32_t SEED = 0x4001;
    /// the mask for the 17 bits of the shift register
    static constexpr uint32_t LFSR_MASK = 0x1FFFF;
    /// the feedback taps of the register in Galois form
    static constexpr uint32_t TAPS = 0x12000;
    /// the bit mask for the 5-bit period
    static constexpr uint8_t PERIOD_MASK = 0x1F;

    /// @brief Reset the generator to its initial condition.
    inline void reset() {
        period = 1;
        counter = 0;
        lfsr = SEED;
    }

    /// @brief Return the period of the generator.
    ///
    /// @returns the period \f$\in [1, 31]\f$
    ///
    inline uint8_t get_period() const { return period; }

    /// @brief Set the period of the generator.
    ///
    /// @param value the new period. Values are wrapped to 5 bits and a period
    /// of 0 behaves like a period of 1
    ///
    inline void set_period(uint8_t value) {
        period = std::max<uint8_t>(value & PERIOD_MASK, 1);
    }

    /// @brief Return the state of the shift register.
    inline uint32_t get_state() const { return lfsr; }

    /// @brief Set the state of the shift register.
    ///
    /// @param value the new 17-bit state of the register
    /// @details
    /// The all-zero state locks the register, so it is replaced by `SEED`.
    ///
    inline void set_state(uint32_t value) {
        value &= LFSR_MASK;
        lfsr = value ? value : SEED;
    }

    /// @brief Return the current output bit without advancing the register.
    ///
    /// @returns the output bit \f$\in \{0, 1\}\f$
    ///
    inline uint8_t get_bit() const { return lfsr & 1; }

    /// @brief Advance the generator by a single tick.
    ///
    /// @returns the output bit after the tick \f$\in \{0, 1\}\f$
    ///
    inline uint8_t tick() {
        if (++counter >= (period << 1)) {
            counter = 0;
            lfsr = (lfsr >> 1) ^ (-(lfsr & 1) & TAPS);
        }
        return lfsr & 1;
    }
};

}  // namespace PSG

#endif  // PSG_GENERAL_INSTRUMENT_AY_3_8910_NOISE_GENERATOR_HPP_
