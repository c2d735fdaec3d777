#pragma once

/// @file geo_coordinate.hpp
/// @brief Validated geographic coordinate of an observing site.

#include "core/types.hpp"

#include <utility>

namespace heliochron::geo
{
    /// @brief Geographic coordinate in degrees (north and east positive).
    ///
    /// Immutable once constructed. Construction rejects non-finite values,
    /// latitudes outside [-90, 90] and longitudes outside [-180, 180].
    class GeoCoordinate
    {
    public:
        /// @throws InvalidCoordinateError on an out-of-range or non-finite value.
        GeoCoordinate(f64 latitude_deg, f64 longitude_deg);

        /// @brief Construct from a (latitude, longitude) pair.
        /// @throws InvalidCoordinateError on an out-of-range or non-finite value.
        explicit GeoCoordinate(const std::pair<f64, f64>& lat_lon);

        [[nodiscard]] f64 latitude() const { return m_latitude; }
        [[nodiscard]] f64 longitude() const { return m_longitude; }

        [[nodiscard]] static bool is_valid(f64 latitude_deg, f64 longitude_deg);

        friend bool operator==(const GeoCoordinate&, const GeoCoordinate&) = default;

        static constexpr f64 kMaxLatitude  = 90.0;
        static constexpr f64 kMaxLongitude = 180.0;

    private:
        f64 m_latitude;
        f64 m_longitude;
    };

} // namespace heliochron::geo
