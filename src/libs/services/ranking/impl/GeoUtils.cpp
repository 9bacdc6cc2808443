/*
 * Copyright (C) 2025 The GroupRank Authors
 *
 * This file is part of GroupRank.
 *
 * GroupRank is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * GroupRank is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with GroupRank.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "GeoUtils.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace grouprank::ranking::geo
{
    namespace
    {
        constexpr double toRadians(double degrees)
        {
            return degrees * std::numbers::pi / 180.0;
        }

        constexpr double toDegrees(double radians)
        {
            return radians * 180.0 / std::numbers::pi;
        }
    } // namespace

    double computeDistanceKm(const GeoPoint& from, const GeoPoint& to)
    {
        const double lat1{ toRadians(from.latitude) };
        const double lat2{ toRadians(to.latitude) };
        const double dLat{ lat2 - lat1 };
        const double dLon{ toRadians(to.longitude - from.longitude) };

        const double a{ std::sin(dLat / 2) * std::sin(dLat / 2) + std::cos(lat1) * std::cos(lat2) * std::sin(dLon / 2) * std::sin(dLon / 2) };
        const double c{ 2 * std::atan2(std::sqrt(a), std::sqrt(std::max(0.0, 1 - a))) };

        return earthRadiusKm * c;
    }

    db::GeoBoundingBox computeBoundingBox(const GeoPoint& center, double radiusKm)
    {
        const double angularRadius{ std::max(0.0, radiusKm) / earthRadiusKm };
        const double lat{ toRadians(center.latitude) };

        db::GeoBoundingBox box;
        box.minLatitude = toDegrees(lat - angularRadius);
        box.maxLatitude = toDegrees(lat + angularRadius);

        if (box.minLatitude <= -90.0 || box.maxLatitude >= 90.0)
        {
            box.minLatitude = std::max(box.minLatitude, -90.0);
            box.maxLatitude = std::min(box.maxLatitude, 90.0);
            box.minLongitude = -180.0;
            box.maxLongitude = 180.0;
            return box;
        }

        const double dLon{ toDegrees(std::asin(std::min(1.0, std::sin(angularRadius) / std::cos(lat)))) };
        box.minLongitude = center.longitude - dLon;
        box.maxLongitude = center.longitude + dLon;

        if (box.minLongitude < -180.0 || box.maxLongitude > 180.0)
        {
            box.minLongitude = -180.0;
            box.maxLongitude = 180.0;
        }

        return box;
    }
} // namespace grouprank::ranking::geo
