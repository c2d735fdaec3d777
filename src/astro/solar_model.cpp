/// @file solar_model.cpp
/// @brief Implementation of the simplified solar position pipeline.

#include "astro/solar_model.hpp"

#include "core/types.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace heliochron::astro
{

// -----------------------------------------------------------------
// Pipeline: M → C → λ → δ, plus the transit Julian Day
// -----------------------------------------------------------------

SolarPosition SolarModel::compute(f64 jd, f64 longitude_deg)
{
    const f64 m      = mean_anomaly(jd);
    const f64 c      = equation_of_center(m);
    const f64 lambda = ecliptic_longitude(m, c);

    return SolarPosition{
        .mean_anomaly       = m,
        .equation_of_center = c,
        .ecliptic_longitude = lambda,
        .declination        = declination(lambda),
        .transit_jd         = transit(jd, longitude_deg, m, lambda),
    };
}

// -----------------------------------------------------------------
// M = 357.5291 + 0.98564736 × (JD − 2451545.0), normalized
// -----------------------------------------------------------------

f64 SolarModel::mean_anomaly(f64 jd)
{
    return normalize_degrees(kMeanAnomalyAtEpoch + kDailyMotion * (jd - astro_constants::kJ2000));
}

// -----------------------------------------------------------------
// C = 1.9148 sin M + 0.0200 sin 2M + 0.0003 sin 3M
// -----------------------------------------------------------------

f64 SolarModel::equation_of_center(f64 mean_anomaly_deg)
{
    const f64 m = glm::radians(mean_anomaly_deg);
    return kCenterCoeff1 * std::sin(m)
         + kCenterCoeff2 * std::sin(2.0 * m)
         + kCenterCoeff3 * std::sin(3.0 * m);
}

f64 SolarModel::ecliptic_longitude(f64 mean_anomaly_deg, f64 equation_of_center_deg)
{
    return normalize_degrees(mean_anomaly_deg + equation_of_center_deg + kPerihelionLongitude + 180.0);
}

f64 SolarModel::declination(f64 ecliptic_longitude_deg)
{
    const f64 sin_dec = std::sin(glm::radians(ecliptic_longitude_deg)) * std::sin(glm::radians(kObliquity));
    return glm::degrees(std::asin(sin_dec));
}

// -----------------------------------------------------------------
// J_transit = 2451545.0 + n + 0.00534 sin M − 0.00692 sin 2λ
// where n = JD − 2451545.0 − longitude / 360
// -----------------------------------------------------------------

f64 SolarModel::transit(f64 jd, f64 longitude_deg, f64 mean_anomaly_deg, f64 ecliptic_longitude_deg)
{
    const f64 n = jd - astro_constants::kJ2000 - longitude_deg / astro_constants::kFullCircleDeg;

    return astro_constants::kJ2000 + n
         + kTransitEccentricity * std::sin(glm::radians(mean_anomaly_deg))
         - kTransitObliquity * std::sin(glm::radians(2.0 * ecliptic_longitude_deg));
}

f64 SolarModel::normalize_degrees(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kFullCircleDeg);
    if (angle < 0.0)
    {
        angle += astro_constants::kFullCircleDeg;
    }
    // fmod of a tiny negative value can round up to exactly 360
    if (angle >= astro_constants::kFullCircleDeg)
    {
        angle = 0.0;
    }
    return angle;
}

} // namespace heliochron::astro
