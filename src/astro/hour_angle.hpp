#pragma once

/// @file hour_angle.hpp
/// @brief Hour-angle solver for the Sun crossing a given altitude.

#include "core/types.hpp"

#include <optional>

namespace heliochron::astro
{
    /// @brief Which side of the transit an event falls on.
    enum class Crossing
    {
        Rising,   ///< Before transit (dawn, sunrise)
        Setting,  ///< After transit (sunset, dusk)
    };

    /// @brief Static utility class solving the sunrise equation.
    class HourAngle
    {
    public:
        HourAngle() = delete;

        /// @brief Hour angle at which the Sun's centre reaches an altitude.
        ///
        /// cos(H0) = (sin h − sin φ · sin δ) / (cos φ · cos δ)
        ///
        /// @param latitude_deg Observer latitude (degrees).
        /// @param declination_deg Solar declination (degrees).
        /// @param altitude_deg Altitude threshold (degrees, negative below horizon).
        /// @return H0 in degrees within [0, 180], or std::nullopt when
        /// |cos H0| > 1 (the Sun never reaches that altitude: polar day or night).
        [[nodiscard]] static std::optional<f64> solve(f64 latitude_deg, f64 declination_deg, f64 altitude_deg);

        /// @brief Julian Day of the crossing: transit ∓ H0 / 360.
        [[nodiscard]] static f64 event_julian_day(f64 transit_jd, f64 hour_angle_deg, Crossing crossing);
    };

} // namespace heliochron::astro
