#pragma once

/// @file error.hpp
/// @brief Exception types raised across the Heliochron library boundary.

#include "core/types.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace heliochron
{
    /// @brief The requested rise/set/twilight event does not happen on this
    /// date at this location (polar day or polar night).
    ///
    /// Raised only by the failing accessors of SolarPositionEngine. The
    /// non-failing `try_` accessors report the same condition as std::nullopt.
    class NoEventError : public std::runtime_error
    {
    public:
        NoEventError(std::string event_label, CalendarDate date)
            : std::runtime_error("No " + event_label
                                 + " occurs on this date for this location (polar night/day)")
            , m_event_label(std::move(event_label))
            , m_date(date)
        {
        }

        [[nodiscard]] const std::string& event_label() const { return m_event_label; }
        [[nodiscard]] CalendarDate date() const { return m_date; }

    private:
        std::string  m_event_label;
        CalendarDate m_date;
    };

    /// @brief A Julian Day reaching instant conversion was NaN, infinite or
    /// outside the microsecond clock range. This is an internal fault, never a
    /// polar condition.
    class InvalidComputationError : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    /// @brief Latitude or longitude is non-finite or out of range.
    class InvalidCoordinateError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace heliochron
