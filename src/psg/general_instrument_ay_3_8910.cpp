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

#include "general_instrument_ay_3_8910.hpp"

namespace PSG {

GeneralInstrumentAy_3_8910::GeneralInstrumentAy_3_8910(
    double clock_rate_,
    unsigned sample_rate_,
    ChipType chip_type
) :
    dac(chip_type),
    resampler(clock_rate_, sample_rate_),
    clock_rate(clock_rate_),
    sample_rate(sample_rate_) { }

void GeneralInstrumentAy_3_8910::reset() {
    for (Channel& channel : channels) channel.reset();
    noise.reset();
    envelope.reset();
    resampler.reset();
}

void GeneralInstrumentAy_3_8910::set_mixer(uint8_t value) {
    channels[PULSE0].set_tone_disabled(value & TONE_A_OFF);
    channels[PULSE1].set_tone_disabled(value & TONE_B_OFF);
    channels[PULSE2].set_tone_disabled(value & TONE_C_OFF);
    channels[PULSE0].set_noise_disabled(value & NOISE_A_OFF);
    channels[PULSE1].set_noise_disabled(value & NOISE_B_OFF);
    channels[PULSE2].set_noise_disabled(value & NOISE_C_OFF);
}

void GeneralInstrumentAy_3_8910::set_register(uint8_t address, uint8_t value) {
    switch (address) {
    case PERIOD_CH_A_LO:
    case PERIOD_CH_B_LO:
    case PERIOD_CH_C_LO:
        channels[address >> 1].set_period_lsb(value);
        break;
    case PERIOD_CH_A_HI:
    case PERIOD_CH_B_HI:
    case PERIOD_CH_C_HI:
        channels[address >> 1].set_period_msb(value);
        break;
    case NOISE_PERIOD:
        noise.set_period(value);
        break;
    case CHANNEL_ENABLES:
        set_mixer(value);
        break;
    case VOLUME_CH_A:
    case VOLUME_CH_B:
    case VOLUME_CH_C:
        channels[address - VOLUME_CH_A].set_amplitude_register(value);
        break;
    case PERIOD_ENVELOPE_LO:
        envelope.set_period_lsb(value);
        break;
    case PERIOD_ENVELOPE_HI:
        envelope.set_period_msb(value);
        break;
    case ENVELOPE_SHAPE:
        envelope.set_shape(value);
        break;
    default:  // the GPIO ports are not emulated
        break;
    }
}

StereoSample GeneralInstrumentAy_3_8910::render_tick() {
    const uint8_t noise_bit = noise.tick();
    const uint8_t envelope_level = envelope.tick();
    StereoSample output;
    for (Channel& channel : channels) {
        const double amplitude = dac.lookup(channel.tick(noise_bit, envelope_level));
        output.left += amplitude * channel.get_pan_left();
        output.right += amplitude * channel.get_pan_right();
    }
    return output;
}

}  // namespace PSG
