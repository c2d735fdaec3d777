/// @file geo_coordinate.cpp
/// @brief Coordinate range validation.

#include "geo/geo_coordinate.hpp"

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace heliochron::geo
{

GeoCoordinate::GeoCoordinate(f64 latitude_deg, f64 longitude_deg)
    : m_latitude(latitude_deg)
    , m_longitude(longitude_deg)
{
    if (!std::isfinite(latitude_deg) || std::abs(latitude_deg) > kMaxLatitude)
    {
        throw InvalidCoordinateError(
            fmt::format("Latitude {} is outside [-90, 90] degrees", latitude_deg));
    }
    if (!std::isfinite(longitude_deg) || std::abs(longitude_deg) > kMaxLongitude)
    {
        throw InvalidCoordinateError(
            fmt::format("Longitude {} is outside [-180, 180] degrees", longitude_deg));
    }
}

GeoCoordinate::GeoCoordinate(const std::pair<f64, f64>& lat_lon)
    : GeoCoordinate(lat_lon.first, lat_lon.second)
{
}

bool GeoCoordinate::is_valid(f64 latitude_deg, f64 longitude_deg)
{
    return std::isfinite(latitude_deg) && std::abs(latitude_deg) <= kMaxLatitude
        && std::isfinite(longitude_deg) && std::abs(longitude_deg) <= kMaxLongitude;
}

} // namespace heliochron::geo
