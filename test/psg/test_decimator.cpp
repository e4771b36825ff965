// Test cases for the anti-aliasing decimator.
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

#include "psg/decimator.hpp"
#define CATCH_CONFIG_MAIN
#include "catch.hpp"

using PSG::Decimator;

/// Write a block of constant points and decimate it.
static double decimate_block(Decimator& decimator, unsigned& block, double value) {
    const unsigned start = Decimator::get_start(block);
    block = (block + 1) % Decimator::BLOCKS;
    for (unsigned offset = 0; offset < Decimator::FACTOR; offset++)
        decimator.write(start, offset, value);
    return decimator.decimate(start);
}

TEST_CASE("Decimator windows cycle through the buffer") {
    REQUIRE(23 == Decimator::BLOCKS);
    REQUIRE(192 == Decimator::get_start(0));
    REQUIRE(16 == Decimator::get_start(Decimator::BLOCKS - 1));
}

SCENARIO("Decimator filters a constant signal") {
    GIVEN("an initialized decimator") {
        Decimator decimator;
        unsigned block = 0;
        WHEN("silence is decimated") {
            THEN("the output is exactly 0") {
                for (unsigned i = 0; i < 100; i++)
                    REQUIRE(0.0 == decimate_block(decimator, block, 0.0));
            }
        }
        WHEN("a constant is decimated for longer than the filter") {
            double output = 0;
            for (unsigned i = 0; i < 100; i++)
                output = decimate_block(decimator, block, 1.0);
            THEN("the output settles at the DC gain of the filter") {
                REQUIRE(output == Approx(0.999970912411191).epsilon(1e-12));
            }
        }
        WHEN("a constant is decimated and the decimator is reset") {
            for (unsigned i = 0; i < 100; i++)
                decimate_block(decimator, block, 1.0);
            decimator.reset();
            block = 0;
            THEN("the history is cleared") {
                REQUIRE(0.0 == decimate_block(decimator, block, 0.0));
            }
        }
    }
}

SCENARIO("Decimator has a finite impulse response") {
    GIVEN("an initialized decimator") {
        Decimator decimator;
        unsigned block = 0;
        WHEN("a single block of ones is followed by silence") {
            const unsigned length = 2 * Decimator::FIR_SIZE / Decimator::FACTOR;
            double response[length];
            response[0] = decimate_block(decimator, block, 1.0);
            for (unsigned i = 1; i < length; i++)
                response[i] = decimate_block(decimator, block, 0.0);
            THEN("the response lasts for the length of the filter") {
                REQUIRE(0.0 != response[Decimator::FIR_SIZE / Decimator::FACTOR - 1]);
                for (unsigned i = Decimator::FIR_SIZE / Decimator::FACTOR; i < length; i++)
                    REQUIRE(0.0 == response[i]);
            }
            THEN("the response peaks at the center of the filter") {
                const unsigned center = Decimator::FIR_SIZE / Decimator::FACTOR / 2;
                for (unsigned i = 0; i < length; i++)
                    REQUIRE(response[i] <= response[center]);
            }
            THEN("the response sums to the DC gain of the filter") {
                double sum = 0;
                for (unsigned i = 0; i < length; i++) sum += response[i];
                REQUIRE(sum == Approx(0.999970912411191).epsilon(1e-12));
            }
        }
    }
}
