// Exceptions that can be thrown by the emulator.
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

#ifndef PSG_EXCEPTIONS_HPP_
#define PSG_EXCEPTIONS_HPP_

#include <exception>
#include <string>

namespace PSG {

/// @brief The base class for all exceptions raised by the emulator.
class Exception : public std::exception {
 private:
    /// the message describing the exception
    std::string message;

 public:
    /// @brief Constructor.
    ///
    /// @param message_ the message describing the exception
    ///
    explicit Exception(const std::string& message_) : message(message_) { }

    /// @brief Return the message describing the exception.
    const char* what() const noexcept override { return message.c_str(); }
};

/// An exception for constructing a chip with invalid clock parameters.
class ConfigurationException : public Exception {
 public:
    /// @brief Constructor.
    ///
    /// @param message the message describing the invalid configuration
    ///
    explicit ConfigurationException(const std::string& message) :
        Exception(message) { }
};

/// An exception for a clock rate that is too high for the sample rate.
class ClockRateTooHighException : public ConfigurationException {
 public:
    /// @brief Constructor.
    ///
    /// @param clock_rate the requested chip clock rate in Hz
    /// @param sample_rate the requested output sample rate in Hz
    /// @param max_clock_rate the exclusive upper bound of the clock rate in Hz
    ///
    ClockRateTooHighException(double clock_rate, unsigned sample_rate, double max_clock_rate) :
        ConfigurationException(
            "the clock rate " +
            std::to_string(clock_rate) +
            "Hz is too high for the sample rate " +
            std::to_string(sample_rate) +
            "Hz (must be less than " +
            std::to_string(max_clock_rate) +
            "Hz)"
        ) { }
};

/// An exception for constructing a chip with an unknown chip type.
class ChipTypeException : public ConfigurationException {
 public:
    /// @brief Constructor.
    ///
    /// @param value the integral value of the unknown chip type
    ///
    explicit ChipTypeException(int value) : ConfigurationException(
        "unsupported chip type " + std::to_string(value)
    ) { }
};

/// An exception for trying to access a channel that is out of bounds.
class ChannelOutOfBoundsException : public Exception {
 public:
    /// @brief Constructor.
    ///
    /// @param index the channel index that was requested
    /// @param count the number of channels that are available
    ///
    ChannelOutOfBoundsException(unsigned index, unsigned count) : Exception(
        "tried to access channel index " +
        std::to_string(index) +
        ", but the chip has " +
        std::to_string(count) +
        " channels"
    ) { }
};

}  // namespace PSG

#endif  // PSG_EXCEPTIONS_HPP_
