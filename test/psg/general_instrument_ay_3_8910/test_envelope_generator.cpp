// Test cases for the AY-3-8910 envelope generator.
//
// Copyright (c) 2020 Christian Kauten
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#include "psg/general_instrument_ay_3_8910/envelope_generator.hpp"
#define CATCH_CONFIG_MAIN
#include "catch.hpp"

using PSG::EnvelopeGenerator;

SCENARIO("EnvelopeGenerator accessors and mutators are used") {
    GIVEN("an initialized envelope generator") {
        EnvelopeGenerator envelope;
        WHEN("the default values are accessed") {
            THEN("the values are correct") {
                REQUIRE(1 == envelope.get_period());
                REQUIRE(0 == envelope.get_shape());
                REQUIRE(0 == envelope.get_level());
            }
        }
        WHEN("the period is set to 0") {
            envelope.set_period(0);
            THEN("the period behaves like 1") {
                REQUIRE(1 == envelope.get_period());
            }
        }
        WHEN("the period bytes are written separately") {
            envelope.set_period_lsb(0xCD);
            envelope.set_period_msb(0xAB);
            THEN("the period is the full 16-bit value") {
                REQUIRE(0xABCD == envelope.get_period());
                REQUIRE(0xAB == envelope.get_period_msb());
                REQUIRE(0xCD == envelope.get_period_lsb());
            }
        }
        WHEN("the shape is set above 4 bits") {
            envelope.set_shape(0xFA);
            THEN("the shape is masked to 4 bits") {
                REQUIRE(0x0A == envelope.get_shape());
            }
        }
        WHEN("a decaying shape is set") {
            envelope.set_shape(EnvelopeGenerator::CONTINUE);
            THEN("the level starts at the top") {
                REQUIRE(EnvelopeGenerator::LEVEL_MAX == envelope.get_level());
            }
        }
        WHEN("an attacking shape is set") {
            envelope.set_shape(EnvelopeGenerator::ATTACK);
            THEN("the level starts at the bottom") {
                REQUIRE(0 == envelope.get_level());
            }
        }
    }
}

TEST_CASE("EnvelopeGenerator segments match the classic shape diagrams") {
    using Segment = EnvelopeGenerator::Segment;
    // the two segments of each shape, from the shape diagrams of the data sheet
    const Segment expected[16][2] = {
        {Segment::SlideDown, Segment::HoldBottom},  // \___
        {Segment::SlideDown, Segment::HoldBottom},  // \___
        {Segment::SlideDown, Segment::HoldBottom},  // \___
        {Segment::SlideDown, Segment::HoldBottom},  // \___
        {Segment::SlideUp, Segment::HoldBottom},    // /___
        {Segment::SlideUp, Segment::HoldBottom},    // /___
        {Segment::SlideUp, Segment::HoldBottom},    // /___
        {Segment::SlideUp, Segment::HoldBottom},    // /___
        {Segment::SlideDown, Segment::SlideDown},   // \\\\ .
        {Segment::SlideDown, Segment::HoldBottom},  // \___
        {Segment::SlideDown, Segment::SlideUp},     // \/\/
        {Segment::SlideDown, Segment::HoldTop},     // \```
        {Segment::SlideUp, Segment::SlideUp},       // ////
        {Segment::SlideUp, Segment::HoldTop},       // /```
        {Segment::SlideUp, Segment::SlideDown},     // /\/\ .
        {Segment::SlideUp, Segment::HoldBottom},    // /___
    };
    for (uint8_t shape = 0; shape < 16; shape++) {
        REQUIRE(expected[shape][0] == EnvelopeGenerator::get_segment(shape, 0));
        REQUIRE(expected[shape][1] == EnvelopeGenerator::get_segment(shape, 1));
    }
}

TEST_CASE("EnvelopeGenerator levels follow each shape") {
    // the level after ticks 1, 31, 32, 33, 64, and 65 at period 1
    const unsigned ticks[6] = {1, 31, 32, 33, 64, 65};
    const uint8_t expected[16][6] = {
        {30, 0, 0, 0, 0, 0},
        {30, 0, 0, 0, 0, 0},
        {30, 0, 0, 0, 0, 0},
        {30, 0, 0, 0, 0, 0},
        {1, 31, 0, 0, 0, 0},
        {1, 31, 0, 0, 0, 0},
        {1, 31, 0, 0, 0, 0},
        {1, 31, 0, 0, 0, 0},
        {30, 0, 31, 30, 31, 30},
        {30, 0, 0, 0, 0, 0},
        {30, 0, 0, 1, 31, 30},
        {30, 0, 31, 31, 31, 31},
        {1, 31, 0, 1, 0, 1},
        {1, 31, 31, 31, 31, 31},
        {1, 31, 31, 30, 0, 1},
        {1, 31, 0, 0, 0, 0},
    };
    for (uint8_t shape = 0; shape < 16; shape++) {
        EnvelopeGenerator envelope;
        envelope.set_shape(shape);
        unsigned tick = 0;
        for (unsigned i = 0; i < 6; i++) {
            uint8_t level = envelope.get_level();
            while (tick < ticks[i]) {
                level = envelope.tick();
                tick++;
            }
            INFO("shape " << static_cast<int>(shape) << " tick " << ticks[i]);
            REQUIRE(expected[shape][i] == level);
        }
    }
}

TEST_CASE("EnvelopeGenerator shapes 0-3 and 4-7 are identical") {
    for (uint8_t shape = 1; shape < 4; shape++) {
        EnvelopeGenerator reference;
        reference.set_shape(0);
        EnvelopeGenerator decay;
        decay.set_shape(shape);
        EnvelopeGenerator attack_reference;
        attack_reference.set_shape(4);
        EnvelopeGenerator attack;
        attack.set_shape(4 + shape);
        for (unsigned i = 0; i < 200; i++) {
            REQUIRE(reference.tick() == decay.tick());
            REQUIRE(attack_reference.tick() == attack.tick());
        }
    }
}

SCENARIO("EnvelopeGenerator is clocked by its period") {
    GIVEN("a decaying envelope with period 3") {
        EnvelopeGenerator envelope;
        envelope.set_period(3);
        envelope.set_shape(EnvelopeGenerator::CONTINUE);
        WHEN("the envelope is ticked") {
            THEN("the level steps every third tick") {
                REQUIRE(31 == envelope.tick());
                REQUIRE(31 == envelope.tick());
                REQUIRE(30 == envelope.tick());
                REQUIRE(30 == envelope.tick());
                REQUIRE(30 == envelope.tick());
                REQUIRE(29 == envelope.tick());
            }
        }
        WHEN("the shape is written again mid-cycle") {
            for (unsigned i = 0; i < 40; i++) envelope.tick();
            envelope.set_shape(EnvelopeGenerator::CONTINUE);
            THEN("the envelope restarts from the top") {
                REQUIRE(31 == envelope.get_level());
                REQUIRE(31 == envelope.tick());
                REQUIRE(31 == envelope.tick());
                REQUIRE(30 == envelope.tick());
            }
        }
        WHEN("the envelope is reset") {
            envelope.tick();
            envelope.reset();
            THEN("the envelope is at power on") {
                REQUIRE(1 == envelope.get_period());
                REQUIRE(0 == envelope.get_shape());
                REQUIRE(0 == envelope.get_level());
            }
        }
    }
}
