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

#include "ScoreUtils.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>

namespace grouprank::ranking::scores
{
    double computeCosineSimilarity(std::span<const double> a, std::span<const double> b)
    {
        assert(a.size() == b.size());

        double dot{};
        double normA{};
        double normB{};
        for (std::size_t i{}; i < a.size(); ++i)
        {
            dot += a[i] * b[i];
            normA += a[i] * a[i];
            normB += b[i] * b[i];
        }

        return dot / ((std::sqrt(normA) + epsilon) * (std::sqrt(normB) + epsilon));
    }

    void minMaxNormalize(std::span<double> values)
    {
        if (values.empty())
            return;

        const auto [minIt, maxIt]{ std::minmax_element(values.begin(), values.end()) };
        const double min{ *minIt };
        const double max{ *maxIt };

        if (max - min < epsilon)
        {
            std::fill(values.begin(), values.end(), 0.0);
            return;
        }

        for (double& value : values)
            value = (value - min) / (max - min);
    }
} // namespace grouprank::ranking::scores
