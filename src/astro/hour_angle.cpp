/// @file hour_angle.cpp
/// @brief Implementation of the hour-angle solver.

#include "astro/hour_angle.hpp"

#include "core/types.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace heliochron::astro
{

std::optional<f64> HourAngle::solve(f64 latitude_deg, f64 declination_deg, f64 altitude_deg)
{
    const f64 lat = glm::radians(latitude_deg);
    const f64 dec = glm::radians(declination_deg);

    const f64 cos_h0 = (std::sin(glm::radians(altitude_deg)) - std::sin(lat) * std::sin(dec))
                     / (std::cos(lat) * std::cos(dec));

    // No real solution: the Sun stays above or below the threshold all day
    if (std::abs(cos_h0) > 1.0)
    {
        return std::nullopt;
    }

    return glm::degrees(std::acos(cos_h0));
}

f64 HourAngle::event_julian_day(f64 transit_jd, f64 hour_angle_deg, Crossing crossing)
{
    const f64 offset = hour_angle_deg / astro_constants::kFullCircleDeg;
    return crossing == Crossing::Rising ? transit_jd - offset : transit_jd + offset;
}

} // namespace heliochron::astro
