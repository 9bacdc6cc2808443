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

#pragma once

#include "database/Types.hpp"
#include "services/ranking/Types.hpp"

namespace grouprank::ranking::geo
{
    static constexpr double earthRadiusKm{ 6371.0 };

    // Great-circle distance
    double computeDistanceKm(const GeoPoint& from, const GeoPoint& to);

    // Smallest latitude/longitude box containing all the points within radiusKm of center
    // Longitudes span the whole range near the poles or when the box crosses the antimeridian
    db::GeoBoundingBox computeBoundingBox(const GeoPoint& center, double radiusKm);
} // namespace grouprank::ranking::geo
