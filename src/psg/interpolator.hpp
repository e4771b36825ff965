// A 4-point parabolic interpolator.
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
// reference: Olli Niemitalo, "Polynomial Interpolators for High-Quality
// Resampling of Oversampled Audio" (2001)
//

#ifndef PSG_INTERPOLATOR_HPP_
#define PSG_INTERPOLATOR_HPP_

namespace PSG {

/// @brief A 2nd-order 4-point parabolic interpolator.
/// @details
/// The coefficients are cached when a value is fed, so the same history can
/// be evaluated at many intermediate points between two input samples.
///
class Interpolator {
 private:
    /// the last four input values, oldest first
    double y[4] = {0, 0, 0, 0};
    /// the polynomial coefficients for the current history
    double coefficients[3] = {0, 0, 0};

 public:
    /// @brief Reset the history and coefficients to zero.
    inline void reset() {
        for (auto& value : y) value = 0;
        for (auto& value : coefficients) value = 0;
    }

    /// @brief Feed a new input value into the interpolator.
    ///
    /// @param input the next input value
    ///
    inline void feed(double input) {
        y[0] = y[1];
        y[1] = y[2];
        y[2] = y[3];
        y[3] = input;
        const double y1 = y[2] - y[0];
        coefficients[0] = 0.5 * y[1] + 0.25 * (y[0] + y[2]);
        coefficients[1] = 0.5 * y1;
        coefficients[2] = 0.25 * (y[3] - y[1] - y1);
    }

    /// @brief Interpolate between the two central values of the history.
    ///
    /// @param x the position of the intermediate point \f$\in [0, 1)\f$
    /// @returns the interpolated value at x
    ///
    inline double interpolate(double x) const {
        return (coefficients[2] * x + coefficients[1]) * x + coefficients[0];
    }
};

}  // namespace PSG

#endif  // PSG_INTERPOLATOR_HPP_
