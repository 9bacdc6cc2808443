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

#include <span>

namespace grouprank::ranking::scores
{
    static constexpr double epsilon{ 1e-9 };

    // (a.b) / ((|a| + epsilon) * (|b| + epsilon)), vectors must have the same size
    double computeCosineSimilarity(std::span<const double> a, std::span<const double> b);

    // In place (x - min) / (max - min), all set to zero if max - min < epsilon
    void minMaxNormalize(std::span<double> values);
} // namespace grouprank::ranking::scores
