// A stereo DC offset removal filter.
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

#ifndef PSG_DC_FILTER_HPP_
#define PSG_DC_FILTER_HPP_

#include <cstddef>
#include <cstring>

namespace PSG {

/// A single frame of stereo audio.
struct StereoSample {
    /// the sample for the left channel
    double left = 0;
    /// the sample for the right channel
    double right = 0;
};

/// @brief A stereo moving-average DC offset removal filter.
/// @tparam SIZE the number of samples in the moving average (a power of 2)
/// @details
/// The average of the last `SIZE` input samples is subtracted from each
/// input sample.
///
template<size_t SIZE = 1024>
class DCFilter {
    static_assert((SIZE & (SIZE - 1)) == 0, "SIZE must be a power of 2");

 private:
    /// the running sum of the left channel history
    double left_sum = 0;
    /// the running sum of the right channel history
    double right_sum = 0;
    /// the history of the left channel
    double left_delay[SIZE];
    /// the history of the right channel
    double right_delay[SIZE];
    /// the index of the oldest sample in the history
    size_t index = 0;

 public:
    /// @brief Initialize a new DC filter with an empty history.
    DCFilter() { reset(); }

    /// @brief Clear the history of the filter.
    inline void reset() {
        left_sum = right_sum = 0;
        memset(left_delay, 0, sizeof left_delay);
        memset(right_delay, 0, sizeof right_delay);
        index = 0;
    }

    /// @brief Filter a stereo frame.
    ///
    /// @param left the input sample for the left channel
    /// @param right the input sample for the right channel
    /// @returns the input frame with the DC offset removed
    ///
    inline StereoSample process(double left, double right) {
        left_sum += -left_delay[index] + left;
        right_sum += -right_delay[index] + right;
        left_delay[index] = left;
        right_delay[index] = right;
        index = (index + 1) & (SIZE - 1);
        StereoSample output;
        output.left = left - left_sum * (1.0 / SIZE);
        output.right = right - right_sum * (1.0 / SIZE);
        return output;
    }
};

}  // namespace PSG

#endif  // PSG_DC_FILTER_HPP_
