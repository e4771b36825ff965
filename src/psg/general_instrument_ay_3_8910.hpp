// General Instrument AY-3-8910 / Yamaha YM2149 sound chip emulator.
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

#ifndef PSG_GENERAL_INSTRUMENT_AY_3_8910_HPP_
#define PSG_GENERAL_INSTRUMENT_AY_3_8910_HPP_

#include <cstdint>
#include "exceptions.hpp"
#include "resampler.hpp"
#include "general_instrument_ay_3_8910/channel.hpp"
#include "general_instrument_ay_3_8910/dac_table.hpp"
#include "general_instrument_ay_3_8910/envelope_generator.hpp"
#include "general_instrument_ay_3_8910/noise_generator.hpp"

namespace PSG {

/// @brief General Instrument AY-3-8910 / Yamaha YM2149 sound chip emulator.
/// @details
/// The chip runs at its own clock rate and is resampled to the output
/// sample rate with a band-limited filter. Common clock rates are:
///
/// -   Amstrad CPC: 1 MHz
/// -   Atari ST: 2 MHz
/// -   MSX: 1.7897725 MHz
/// -   Oric-1: 1 MHz
/// -   ZX Spectrum: 1.7734 MHz
///
/// Register writes never fail; out of range values are masked to the width
/// of the register as on the hardware. Each call to `render` advances the
/// chip by exactly one output sample of emulated time.
///
class GeneralInstrumentAy_3_8910 {
 public:
    /// the number of oscillators on the chip
    static constexpr unsigned OSC_COUNT = 3;

    /// the indexes of the channels on the chip
    enum Channels {
        PULSE0 = 0,
        PULSE1 = 1,
        PULSE2 = 2
    };

    /// symbolic flags for enabling channels using the mixer register
    enum ChannelEnable : uint8_t {
        /// turn on all channels
        ALL_ON      = 0b00000000,
        /// turn off channel A tone
        TONE_A_OFF  = 0b00000001,
        /// turn off channel B tone
        TONE_B_OFF  = 0b00000010,
        /// turn off channel C tone
        TONE_C_OFF  = 0b00000100,
        /// turn off channel A noise
        NOISE_A_OFF = 0b00001000,
        /// turn off channel B noise
        NOISE_B_OFF = 0b00010000,
        /// turn off channel C noise
        NOISE_C_OFF = 0b00100000,
    };

    /// the registers on the chip
    enum Register : uint8_t {
        /// the low 8 bits of the 12 bit period for channel A
        PERIOD_CH_A_LO,
        /// the high 4 bits of the 12 bit period for channel A
        PERIOD_CH_A_HI,
        /// the low 8 bits of the 12 bit period for channel B
        PERIOD_CH_B_LO,
        /// the high 4 bits of the 12 bit period for channel B
        PERIOD_CH_B_HI,
        /// the low 8 bits of the 12 bit period for channel C
        PERIOD_CH_C_LO,
        /// the high 4 bits of the 12 bit period for channel C
        PERIOD_CH_C_HI,
        /// the 5-bit noise period
        NOISE_PERIOD,
        /// the mixer (channel enable) register
        CHANNEL_ENABLES,
        /// the volume register for channel A
        VOLUME_CH_A,
        /// the volume register for channel B
        VOLUME_CH_B,
        /// the volume register for channel C
        VOLUME_CH_C,
        /// the low 8 bits of the 16-bit period for the envelope
        PERIOD_ENVELOPE_LO,
        /// the high 8 bits of the 16-bit period for the envelope
        PERIOD_ENVELOPE_HI,
        /// the shape of the envelope
        ENVELOPE_SHAPE,
        /// the data store for GPIO port A (not emulated)
        IO_PORT_A,
        /// the data store for GPIO port B (not emulated)
        IO_PORT_B,
        /// the number of registers on the chip
        NUM_REGISTERS
    };

 private:
    /// the channels on the chip
    Channel channels[OSC_COUNT];
    /// the noise generator shared by the channels
    NoiseGenerator noise;
    /// the envelope generator shared by the channels
    EnvelopeGenerator envelope;
    /// the DAC of the chip variant
    const DACTable dac;
    /// the resampler from chip ticks to output samples
    Resampler resampler;
    /// the chip clock rate in Hz
    const double clock_rate;
    /// the output sample rate in Hz
    const unsigned sample_rate;

    /// @brief Advance all generators by one tick and mix the channels.
    ///
    /// @returns the raw stereo output of the chip for the tick
    ///
    StereoSample render_tick();

    /// @brief Return the channel at the given index.
    ///
    /// @param index the index of the channel
    /// @throws ChannelOutOfBoundsException if the index is not less than
    /// `OSC_COUNT`
    ///
    inline Channel& get_channel_checked(unsigned index) {
        if (index >= OSC_COUNT)
            throw ChannelOutOfBoundsException(index, OSC_COUNT);
        return channels[index];
    }

    /// Disable the copy constructor.
    GeneralInstrumentAy_3_8910(const GeneralInstrumentAy_3_8910&);

    /// Disable the assignment operator.
    GeneralInstrumentAy_3_8910& operator=(const GeneralInstrumentAy_3_8910&);

 public:
    /// @brief Initialize a new AY-3-8910.
    ///
    /// @param clock_rate_ the chip clock rate in Hz
    /// @param sample_rate_ the output sample rate in Hz
    /// @param chip_type the chip variant to emulate
    /// @throws ConfigurationException if the clock rate is not positive and
    /// finite, the sample rate is 0, or the chip type is unknown
    /// @throws ClockRateTooHighException if the clock rate is not less than
    /// 64 times the sample rate
    ///
    GeneralInstrumentAy_3_8910(
        double clock_rate_,
        unsigned sample_rate_,
        ChipType chip_type = ChipType::YM2149
    );

    /// @brief Return the chip clock rate in Hz.
    inline double get_clock_rate() const { return clock_rate; }

    /// @brief Return the output sample rate in Hz.
    inline unsigned get_sample_rate() const { return sample_rate; }

    /// @brief Return the emulated chip variant.
    inline ChipType get_chip_type() const { return dac.get_chip_type(); }

    /// @brief Return the DAC table of the emulated chip variant.
    inline const DACTable& get_dac() const { return dac; }

    /// @brief Return the resampler of the chip.
    inline const Resampler& get_resampler() const { return resampler; }

    /// @brief Return the channel at the given index.
    ///
    /// @param index the index of the channel \f$\in [0, 3)\f$
    /// @throws ChannelOutOfBoundsException if the index is invalid
    ///
    inline const Channel& get_channel(unsigned index) const {
        if (index >= OSC_COUNT)
            throw ChannelOutOfBoundsException(index, OSC_COUNT);
        return channels[index];
    }

    /// @brief Return the mutable channel at the given index.
    ///
    /// @param index the index of the channel \f$\in [0, 3)\f$
    /// @throws ChannelOutOfBoundsException if the index is invalid
    ///
    inline Channel& get_channel(unsigned index) { return get_channel_checked(index); }

    /// @brief Return the noise generator shared by the channels.
    inline const NoiseGenerator& get_noise_generator() const { return noise; }

    /// @brief Return the mutable noise generator shared by the channels.
    inline NoiseGenerator& get_noise_generator() { return noise; }

    /// @brief Return the envelope generator shared by the channels.
    inline const EnvelopeGenerator& get_envelope_generator() const { return envelope; }

    /// @brief Return the mutable envelope generator shared by the channels.
    inline EnvelopeGenerator& get_envelope_generator() { return envelope; }

    /// @brief Reset the generators, registers, and filters to power on.
    /// @details
    /// The clock rate, sample rate, and chip variant are kept.
    ///
    void reset();

    /// @brief Set the tone period of a channel.
    ///
    /// @param channel the index of the channel
    /// @param period the 12-bit period, where 0 behaves like 1
    ///
    inline void set_tone_period(unsigned channel, uint16_t period) {
        get_channel_checked(channel).set_period(period);
    }

    /// @brief Set the fixed amplitude of a channel.
    ///
    /// @param channel the index of the channel
    /// @param amplitude the 4-bit amplitude
    ///
    inline void set_amplitude(unsigned channel, uint8_t amplitude) {
        get_channel_checked(channel).set_amplitude(amplitude);
    }

    /// @brief Set whether the tone of a channel is switched off.
    inline void set_tone_disabled(unsigned channel, bool disabled) {
        get_channel_checked(channel).set_tone_disabled(disabled);
    }

    /// @brief Set whether the noise of a channel is switched off.
    inline void set_noise_disabled(unsigned channel, bool disabled) {
        get_channel_checked(channel).set_noise_disabled(disabled);
    }

    /// @brief Set whether the envelope controls the amplitude of a channel.
    inline void set_envelope_enabled(unsigned channel, bool enabled) {
        get_channel_checked(channel).set_envelope_enabled(enabled);
    }

    /// @brief Set the stereo panning of a channel.
    ///
    /// @param channel the index of the channel
    /// @param balance the balance \f$\in [0, 1]\f$ from full left to full right
    /// @param equal_power true to pan by power instead of amplitude
    ///
    inline void set_panning(unsigned channel, double balance, bool equal_power = false) {
        get_channel_checked(channel).set_panning(balance, equal_power);
    }

    /// @brief Set the period of the noise generator.
    ///
    /// @param period the 5-bit period, where 0 behaves like 1
    ///
    inline void set_noise_period(uint8_t period) { noise.set_period(period); }

    /// @brief Write the mixer (channel enable) register.
    ///
    /// @param value the bitmask of `ChannelEnable` flags. The GPIO direction
    /// bits 6 and 7 are ignored
    ///
    void set_mixer(uint8_t value);

    /// @brief Set the period of the envelope generator.
    ///
    /// @param period the 16-bit period, where 0 behaves like 1
    ///
    inline void set_envelope_period(uint16_t period) { envelope.set_period(period); }

    /// @brief Set the shape of the envelope generator and restart it.
    ///
    /// @param shape the 4-bit shape of the envelope
    ///
    inline void set_envelope_shape(uint8_t shape) { envelope.set_shape(shape); }

    /// @brief Write a value to a register.
    ///
    /// @param address the index of the register. Writes to the GPIO ports
    /// and to addresses past the last register have no effect
    /// @param value the value to write to the register
    ///
    void set_register(uint8_t address, uint8_t value);

    /// @brief Advance the chip by one output sample of emulated time.
    ///
    /// @returns the band-limited stereo output sample
    ///
    inline StereoSample render() {
        return resampler.render([this]() { return render_tick(); });
    }
};

}  // namespace PSG

#endif  // PSG_GENERAL_INSTRUMENT_AY_3_8910_HPP_
