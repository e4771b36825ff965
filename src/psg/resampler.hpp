// A band-limited resampler from a chip clock to an audio sample rate.
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

#ifndef PSG_RESAMPLER_HPP_
#define PSG_RESAMPLER_HPP_

#include <cmath>
#include "dc_filter.hpp"
#include "decimator.hpp"
#include "exceptions.hpp"
#include "interpolator.hpp"

namespace PSG {

/// @brief A stereo band-limited resampler from chip ticks to audio samples.
/// @details
/// Each output sample is made of `Decimator::FACTOR` points of an
/// over-sampled signal. For every point the fractional phase advances by
/// `step` chip ticks; whenever it crosses 1 a new chip tick is rendered and
/// fed to the interpolators. The interpolated points are then low-pass
/// filtered and decimated down to the output rate, and the DC offset is
/// removed. The fractional remainder of the phase carries over between
/// samples, so the long run ratio of ticks to samples is exact up to the
/// precision of a double.
///
class Resampler {
 private:
    /// the number of chip ticks per over-sampled point \f$\in (0, 1)\f$
    double step;
    /// the fractional phase between the last two chip ticks \f$\in [0, 1)\f$
    double x = 0;
    /// the index of the next block in the decimator windows
    unsigned block = 0;

    /// the interpolator for the left channel
    Interpolator left_interpolator;
    /// the interpolator for the right channel
    Interpolator right_interpolator;
    /// the anti-aliasing decimator for the left channel
    Decimator left_decimator;
    /// the anti-aliasing decimator for the right channel
    Decimator right_decimator;
    /// the DC offset removal filter for both channels
    DCFilter<> dc_filter;

 public:
    /// the number of chip clock cycles per chip tick
    static constexpr unsigned CLOCK_DIVIDER = 8;

    /// @brief Return the exclusive upper bound of the chip clock rate.
    ///
    /// @param sample_rate the output sample rate in Hz
    /// @returns the clock rate at which one chip tick falls on every
    /// over-sampled point, i.e., 64 times the sample rate
    ///
    static constexpr double get_max_clock_rate(unsigned sample_rate) {
        return sample_rate * static_cast<double>(CLOCK_DIVIDER * Decimator::FACTOR);
    }

    /// @brief Return the number of chip ticks per over-sampled point.
    ///
    /// @param clock_rate the chip clock rate in Hz
    /// @param sample_rate the output sample rate in Hz
    /// @returns the phase increment for each over-sampled point
    /// @throws ConfigurationException if the rates are not positive and finite
    /// @throws ClockRateTooHighException if the clock rate is not less than
    /// `get_max_clock_rate(sample_rate)`
    ///
    static double get_step(double clock_rate, unsigned sample_rate) {
        if (!std::isfinite(clock_rate) || !(clock_rate > 0))
            throw ConfigurationException("clock_rate must be a positive, finite number.");
        if (!(sample_rate > 0))
            throw ConfigurationException("sample_rate must be greater than 0.");
        const double step_ = clock_rate / (sample_rate * static_cast<double>(CLOCK_DIVIDER) * Decimator::FACTOR);
        if (step_ >= 1.0)
            throw ClockRateTooHighException(clock_rate, sample_rate, get_max_clock_rate(sample_rate));
        if (!(step_ > 0))  // the clock rate underflows the ratio
            throw ConfigurationException("clock_rate : sample_rate ratio is too small.");
        return step_;
    }

    /// @brief Initialize a new resampler.
    ///
    /// @param clock_rate the chip clock rate in Hz
    /// @param sample_rate the output sample rate in Hz
    /// @throws ConfigurationException if the rates are invalid
    ///
    Resampler(double clock_rate, unsigned sample_rate) :
        step(get_step(clock_rate, sample_rate)) { }

    /// @brief Return the number of chip ticks per over-sampled point.
    inline double get_step() const { return step; }

    /// @brief Return the fractional phase of the chip clock.
    inline double get_phase() const { return x; }

    /// @brief Clear the phase and the history of all filters.
    inline void reset() {
        x = 0;
        block = 0;
        left_interpolator.reset();
        right_interpolator.reset();
        left_decimator.reset();
        right_decimator.reset();
        dc_filter.reset();
    }

    /// @brief Render a single output sample.
    ///
    /// @tparam Tick a callable with signature `StereoSample()`
    /// @param tick a function that advances the chip by one tick and returns
    /// its raw stereo output
    /// @returns the band-limited output sample
    ///
    template<typename Tick>
    StereoSample render(Tick&& tick) {
        const unsigned start = Decimator::get_start(block);
        block = (block + 1) % Decimator::BLOCKS;
        // newer points go to lower offsets in the block
        for (unsigned offset = Decimator::FACTOR; offset-- > 0;) {
            x += step;
            if (x >= 1.0) {
                x -= 1.0;
                const StereoSample input = tick();
                left_interpolator.feed(input.left);
                right_interpolator.feed(input.right);
            }
            left_decimator.write(start, offset, left_interpolator.interpolate(x));
            right_decimator.write(start, offset, right_interpolator.interpolate(x));
        }
        return dc_filter.process(
            left_decimator.decimate(start),
            right_decimator.decimate(start)
        );
    }
};

}  // namespace PSG

#endif  // PSG_RESAMPLER_HPP_
