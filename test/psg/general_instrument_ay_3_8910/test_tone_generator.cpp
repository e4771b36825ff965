// Test cases for the AY-3-8910 tone generator.
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

#include "psg/general_instrument_ay_3_8910/tone_generator.hpp"
#define CATCH_CONFIG_MAIN
#include "catch.hpp"

using PSG::ToneGenerator;

SCENARIO("ToneGenerator accessors and mutators are used") {
    GIVEN("an initialized tone generator") {
        ToneGenerator tone;
        WHEN("the default values are accessed") {
            THEN("the values are correct") {
                REQUIRE(1 == tone.get_period());
                REQUIRE(0 == tone.get_bit());
            }
        }
        WHEN("the period is set to a valid value") {
            tone.set_period(0x0ABC);
            THEN("the period and its bytes are correct") {
                REQUIRE(0x0ABC == tone.get_period());
                REQUIRE(0x0A == tone.get_period_msb());
                REQUIRE(0xBC == tone.get_period_lsb());
            }
        }
        WHEN("the period is set to 0") {
            tone.set_period(0);
            THEN("the period behaves like 1") {
                REQUIRE(1 == tone.get_period());
            }
        }
        WHEN("the period is set above 12 bits") {
            tone.set_period(0xF123);
            THEN("the period is masked to 12 bits") {
                REQUIRE(0x0123 == tone.get_period());
            }
        }
        WHEN("the period bytes are written separately") {
            tone.set_period_lsb(0x34);
            tone.set_period_msb(0xF2);
            THEN("the high byte is masked to 4 bits") {
                REQUIRE(0x0234 == tone.get_period());
            }
            THEN("writing the low byte keeps the high byte") {
                tone.set_period_lsb(0x56);
                REQUIRE(0x0256 == tone.get_period());
            }
        }
    }
}

SCENARIO("ToneGenerator produces a square wave") {
    GIVEN("a tone generator with period 1") {
        ToneGenerator tone;
        WHEN("the generator is ticked") {
            THEN("the output toggles every tick") {
                for (unsigned i = 0; i < 16; i++)
                    REQUIRE(((i + 1) & 1) == tone.tick());
            }
        }
    }
    GIVEN("a tone generator with period 0") {
        ToneGenerator tone;
        tone.set_period(0);
        WHEN("the generator is ticked") {
            THEN("the output toggles every tick") {
                REQUIRE(1 == tone.tick());
                REQUIRE(0 == tone.tick());
                REQUIRE(1 == tone.tick());
            }
        }
    }
    GIVEN("a tone generator with period 3") {
        ToneGenerator tone;
        tone.set_period(3);
        WHEN("the generator is ticked") {
            THEN("the output toggles every third tick") {
                const uint8_t expected[12] = {0, 0, 1, 1, 1, 0, 0, 0, 1, 1, 1, 0};
                for (unsigned i = 0; i < 12; i++)
                    REQUIRE(expected[i] == tone.tick());
            }
        }
    }
    GIVEN("a tone generator with period 100") {
        ToneGenerator tone;
        tone.set_period(100);
        WHEN("the generator is ticked for many cycles") {
            unsigned ones = 0;
            unsigned edges = 0;
            uint8_t last = tone.get_bit();
            for (unsigned i = 0; i < 20000; i++) {
                const uint8_t bit = tone.tick();
                ones += bit;
                edges += bit != last;
                last = bit;
            }
            THEN("the wave has a 50% duty cycle") {
                REQUIRE(10000 == ones);
            }
            THEN("the wave toggles once per period") {
                REQUIRE(200 == edges);
            }
        }
        WHEN("the generator is reset") {
            tone.tick();
            tone.reset();
            THEN("the generator is at power on") {
                REQUIRE(1 == tone.get_period());
                REQUIRE(0 == tone.get_bit());
            }
        }
    }
}
