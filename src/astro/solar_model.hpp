#pragma once

/// @file solar_model.hpp
/// @brief Simplified geocentric solar position (NOAA / Meeus approximation).

#include "core/types.hpp"

namespace heliochron::astro
{
    /// @brief Sun position quantities for one model day.
    /// Angles are in degrees.
    struct SolarPosition
    {
        f64 mean_anomaly;        ///< M, normalized to [0, 360)
        f64 equation_of_center;  ///< C, orbital eccentricity correction
        f64 ecliptic_longitude;  ///< λ, normalized to [0, 360)
        f64 declination;         ///< δ, in [-90, 90]
        f64 transit_jd;          ///< Julian Day of local solar noon
    };

    /// @brief Static utility class computing the Sun's position from a Julian Day.
    ///
    /// A single calibration is used throughout: daily motion 0.98564736°,
    /// perihelion 102.9373°, obliquity 23.43929111°, transit corrections
    /// 0.00534 / 0.00692. Rise and set times agree with NOAA to about a minute
    /// at mid latitudes.
    class SolarModel
    {
    public:
        SolarModel() = delete;

        /// @brief Full pipeline for one Julian Day at a given longitude.
        /// @param jd Julian Day from JulianDay::for_date().
        /// @param longitude_deg Observer longitude (degrees, east positive).
        [[nodiscard]] static SolarPosition compute(f64 jd, f64 longitude_deg);

        /// @brief Mean solar anomaly, linear from J2000.0.
        [[nodiscard]] static f64 mean_anomaly(f64 jd);

        /// @brief Equation of center (third-order Fourier series in M).
        [[nodiscard]] static f64 equation_of_center(f64 mean_anomaly_deg);

        /// @brief Ecliptic longitude λ = M + C + perihelion + 180.
        [[nodiscard]] static f64 ecliptic_longitude(f64 mean_anomaly_deg, f64 equation_of_center_deg);

        /// @brief Declination δ = asin(sin λ · sin ε).
        [[nodiscard]] static f64 declination(f64 ecliptic_longitude_deg);

        /// @brief Julian Day of the Sun's transit across the local meridian.
        [[nodiscard]] static f64 transit(f64 jd, f64 longitude_deg,
                                         f64 mean_anomaly_deg, f64 ecliptic_longitude_deg);

        /// @brief Normalize an angle in degrees to the range [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle);

        static constexpr f64 kMeanAnomalyAtEpoch  = 357.5291;     ///< M at J2000.0
        static constexpr f64 kDailyMotion         = 0.98564736;   ///< deg/day
        static constexpr f64 kPerihelionLongitude = 102.9373;     ///< deg
        static constexpr f64 kObliquity           = 23.43929111;  ///< deg
        static constexpr f64 kCenterCoeff1        = 1.9148;       ///< sin(M)
        static constexpr f64 kCenterCoeff2        = 0.0200;       ///< sin(2M)
        static constexpr f64 kCenterCoeff3        = 0.0003;       ///< sin(3M)
        static constexpr f64 kTransitEccentricity = 0.00534;
        static constexpr f64 kTransitObliquity    = 0.00692;
    };

} // namespace heliochron::astro
