// The envelope generator on the AY-3-8910.
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

#ifndef PSG_GENERAL_INSTRUMENT_AY_3_8910_ENVELOPE_GENERATOR_HPP_
#define PSG_GENERAL_INSTRUMENT_AY_3_8910_ENVELOPE_GENERATOR_HPP_

#include <algorithm>
#include <cstdint>

namespace PSG {

/// @brief The 5-bit envelope generator shared by all three channels.
/// @details
/// An envelope is made of two segments. The generator runs the first
/// segment and then either holds in the second, or bounces between the two
/// segments forever. The sixteen shape codes collapse onto eight distinct
/// envelopes because the first eight codes (continue cleared) all hold at
/// the bottom after the first ramp.
///
class EnvelopeGenerator {
 public:
    /// symbolic flags for the 4-bit shape register
    enum Shape : uint8_t {
        /// hold the level at the end of the first ramp
        HOLD      = 0b0001,
        /// reverse direction at the end of each ramp
        ALTERNATE = 0b0010,
        /// ramp up (instead of down) in the first ramp
        ATTACK    = 0b0100,
        /// keep going after the first ramp
        CONTINUE  = 0b1000,
    };

    /// The behavior of a single segment of an envelope.
    enum class Segment : uint8_t {
        /// slide from 31 to 0, then move to the other segment
        SlideDown,
        /// slide from 0 to 31, then move to the other segment
        SlideUp,
        /// hold at 31 indefinitely
        HoldTop,
        /// hold at 0 indefinitely
        HoldBottom
    };

    /// the maximal output level of the generator
    static constexpr uint8_t LEVEL_MAX = 31;

    /// @brief Return the segment of the given shape with given index.
    ///
    /// @param shape the 4-bit shape code
    /// @param index the index of the segment \f$\in \{0, 1\}\f$
    /// @returns the segment for the shape at the given index
    ///
    static constexpr Segment get_segment(uint8_t shape, uint8_t index) {
        const Segment ramp = (shape & ATTACK) ? Segment::SlideUp : Segment::SlideDown;
        const Segment reverse = (shape & ATTACK) ? Segment::SlideDown : Segment::SlideUp;
        if (index == 0)
            return ramp;
        if (!(shape & CONTINUE))
            return Segment::HoldBottom;
        if (shape & HOLD)  // the level bounces once when alternate is set
            return (!(shape & ATTACK) != !(shape & ALTERNATE)) ? Segment::HoldTop : Segment::HoldBottom;
        return (shape & ALTERNATE) ? reverse : ramp;
    }

 private:
    /// the period of the generator \f$\in [1, 65535]\f$
    uint16_t period = 1;
    /// the number of ticks since the last step of the level
    uint16_t position = 0;
    /// the 4-bit shape of the envelope
    uint8_t shape = 0;
    /// the index of the active segment \f$\in \{0, 1\}\f$
    uint8_t segment = 0;
    /// the output level \f$\in [0, 31]\f$
    uint8_t level = 0;

    /// @brief Restart the active segment at its initial level.
    inline void reset_segment() {
        switch (get_segment(shape, segment)) {
        case Segment::SlideDown:
        case Segment::HoldTop:
            level = LEVEL_MAX;
            break;
        case Segment::SlideUp:
        case Segment::HoldBottom:
            level = 0;
            break;
        }
    }

 public:
    /// @brief Reset the generator to its initial condition.
    inline void reset() {
        period = 1;
        position = 0;
        shape = 0;
        segment = 0;
        level = 0;
    }

    /// @brief Return the period of the generator.
    ///
    /// @returns the period \f$\in [1, 65535]\f$
    ///
    inline uint16_t get_period() const { return period; }

    /// @brief Set the period of the generator.
    ///
    /// @param value the new period. A period of 0 behaves like a period of 1
    ///
    inline void set_period(uint16_t value) {
        period = std::max<uint16_t>(value, 1);
    }

    /// @brief Return the most significant byte of the period.
    inline uint8_t get_period_msb() const { return period >> 8; }

    /// @brief Set the most significant byte of the period.
    ///
    /// @param msb the upper 8 bits of the period
    /// @details
    /// A resulting period of 0 is set to 1, so the MSB should be written
    /// before the LSB.
    ///
    inline void set_period_msb(uint8_t msb) {
        set_period((period & 0x00FF) | (msb << 8));
    }

    /// @brief Return the least significant byte of the period.
    inline uint8_t get_period_lsb() const { return period & 0xFF; }

    /// @brief Set the least significant byte of the period.
    ///
    /// @param lsb the lower 8 bits of the period
    ///
    inline void set_period_lsb(uint8_t lsb) {
        set_period((period & 0xFF00) | lsb);
    }

    /// @brief Return the shape of the envelope.
    ///
    /// @returns the 4-bit shape code
    ///
    inline uint8_t get_shape() const { return shape; }

    /// @brief Set the shape of the envelope and restart it.
    ///
    /// @param value the new shape. Values are wrapped to 4 bits
    ///
    inline void set_shape(uint8_t value) {
        shape = value & 0x0F;
        position = 0;
        segment = 0;
        reset_segment();
    }

    /// @brief Return the current output level without advancing.
    ///
    /// @returns the output level \f$\in [0, 31]\f$
    ///
    inline uint8_t get_level() const { return level; }

    /// @brief Advance the generator by a single tick.
    ///
    /// @returns the output level after the tick \f$\in [0, 31]\f$
    ///
    inline uint8_t tick() {
        if (++position < period) return level;
        position = 0;
        switch (get_segment(shape, segment)) {
        case Segment::SlideDown:
            if (level == 0) {
                segment ^= 1;
                reset_segment();
            } else {
                level--;
            }
            break;
        case Segment::SlideUp:
            if (level >= LEVEL_MAX) {
                segment ^= 1;
                reset_segment();
            } else {
                level++;
            }
            break;
        case Segment::HoldTop:
        case Segment::HoldBottom:
            break;
        }
        return level;
    }
};

}  // namespace PSG

#endif  // PSG_GENERAL_INSTRUMENT_AY_3_8910_ENVELOPE_GENERATOR_HPP_
