// Digital-to-analog conversion tables for the AY-3-8910 and YM2149.
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

#ifndef PSG_GENERAL_INSTRUMENT_AY_3_8910_DAC_TABLE_HPP_
#define PSG_GENERAL_INSTRUMENT_AY_3_8910_DAC_TABLE_HPP_

#include <cstdint>
#include "../exceptions.hpp"

namespace PSG {

/// The variants of the chip that can be emulated.
enum class ChipType : uint8_t {
    /// the General Instrument AY-3-8910 (4-bit DAC)
    AY_3_8910 = 0,
    /// the Yamaha YM2149 (5-bit DAC, smoother envelopes)
    YM2149 = 1
};

/// @brief A measured level to amplitude table for the DAC of a chip variant.
/// @details
/// Levels are 5-bit values. The AY-3-8910 only has 16 distinct output
/// levels, so its table repeats every entry twice. On both chips a level of
/// 0 is silent.
///
class DACTable {
 public:
    /// the number of entries in the table
    static constexpr unsigned SIZE = 32;

 private:
    /// the chip variant the table was measured from
    ChipType chip_type;
    /// a pointer to the static table for the chip variant
    const double* table;

    /// @brief Return the table for the given chip variant.
    ///
    /// @param type the chip variant to return the table for
    /// @returns a pointer to the 32 amplitudes of the chip variant
    ///
    static const double* get_table(ChipType type) {
        static constexpr double AY_3_8910_TABLE[SIZE] = {
            0.0,             0.0,             0.00999465934234, 0.00999465934234,
            0.0144502937362, 0.0144502937362, 0.0210574502174,  0.0210574502174,
            0.0307011520562, 0.0307011520562, 0.0455481803616,  0.0455481803616,
            0.0644998855573, 0.0644998855573, 0.107362478065,   0.107362478065,
            0.126588845655,  0.126588845655,  0.20498970016,    0.20498970016,
            0.292210269322,  0.292210269322,  0.372838941024,   0.372838941024,
            0.492530708782,  0.492530708782,  0.635324635691,   0.635324635691,
            0.805584802014,  0.805584802014,  1.0,              1.0
        };
        static constexpr double YM2149_TABLE[SIZE] = {
            0.0,             0.0,             0.00465400167849, 0.00772106507973,
            0.0109559777218, 0.0139620050355, 0.0169985503929,  0.0200198367285,
            0.024368657969,  0.029694056611,  0.0350652323186,  0.0403906309606,
            0.0485389486534, 0.0583352407111, 0.0680552376593,  0.0777752346075,
            0.0925154497597, 0.111085679408,  0.129747463188,   0.148485542077,
            0.17666895552,   0.211551079576,  0.246387426566,   0.281101701381,
            0.333730067903,  0.400427252613,  0.467383840696,   0.53443198291,
            0.635172045472,  0.75800717174,   0.879926756695,   1.0
        };
        switch (type) {
        case ChipType::AY_3_8910: return AY_3_8910_TABLE;
        case ChipType::YM2149: return YM2149_TABLE;
        }
        throw ChipTypeException(static_cast<int>(type));
    }

 public:
    /// @brief Initialize a new DAC table.
    ///
    /// @param type the chip variant to load the table for
    /// @throws ChipTypeException if the chip type is not known
    ///
    explicit DACTable(ChipType type) : chip_type(type), table(get_table(type)) { }

    /// @brief Return the chip variant the table belongs to.
    inline ChipType get_chip_type() const { return chip_type; }

    /// @brief Return the amplitude for the given level.
    ///
    /// @param level the 5-bit output level \f$\in [0, 31]\f$
    /// @returns the amplitude of the level \f$\in [0, 1]\f$
    ///
    inline double lookup(uint8_t level) const { return table[level & (SIZE - 1)]; }
};

}  // namespace PSG

#endif  // PSG_GENERAL_INSTRUMENT_AY_3_8910_DAC_TABLE_HPP_
