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

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

#include "services/ranking/Types.hpp"

namespace grouprank::ranking
{
    class EnsembleRanker
    {
    public:
        EnsembleRanker(double w1Min, double w1Max, double coverageThreshold);

        // w1 grows with the history strength, then is reduced if too few candidates have a collaborative score
        RankingWeights computeWeights(double historyStrength, std::span<const double> collaborativeScores) const;

        static std::vector<double> computeFinalScores(const RankingWeights& weights, std::span<const double> contentScores, std::span<const double> collaborativeScores);

        // Candidate indexes, by final score desc, creation date desc, distance asc, host reputation desc and then original order
        static std::vector<std::size_t> sort(std::span<const CandidateListing> candidates, std::span<const double> finalScores);

        // page starts at 1, lower values are considered as the first page
        template<typename T>
        static std::span<const T> getPage(std::span<const T> items, std::size_t page, std::size_t size)
        {
            const std::size_t pageIndex{ page > 0 ? page - 1 : 0 };
            if (size == 0 || items.empty() || pageIndex > (items.size() - 1) / size)
                return {};

            const std::size_t offset{ pageIndex * size };
            return items.subspan(offset, std::min(size, items.size() - offset));
        }

    private:
        const double _w1Min;
        const double _w1Max;
        const double _coverageThreshold;
    };
} // namespace grouprank::ranking
