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

#include "EnsembleRanker.hpp"

#include <algorithm>
#include <cassert>
#include <numeric>

namespace grouprank::ranking
{
    EnsembleRanker::EnsembleRanker(double w1Min, double w1Max, double coverageThreshold)
        : _w1Min{ w1Min }
        , _w1Max{ w1Max }
        , _coverageThreshold{ coverageThreshold }
    {
    }

    RankingWeights EnsembleRanker::computeWeights(double historyStrength, std::span<const double> collaborativeScores) const
    {
        RankingWeights weights;
        weights.historyStrength = std::clamp(historyStrength, 0.0, 1.0);
        weights.w1 = _w1Min + (_w1Max - _w1Min) * weights.historyStrength;

        if (!collaborativeScores.empty())
        {
            const auto scoredCount{ std::count_if(collaborativeScores.begin(), collaborativeScores.end(), [](double score) { return score > 0; }) };
            weights.coverage = static_cast<double>(scoredCount) / static_cast<double>(collaborativeScores.size());
        }

        if (weights.coverage < _coverageThreshold)
            weights.w1 *= std::min(1.0, weights.coverage / _coverageThreshold);

        weights.w0 = 1.0 - weights.w1;

        return weights;
    }

    std::vector<double> EnsembleRanker::computeFinalScores(const RankingWeights& weights, std::span<const double> contentScores, std::span<const double> collaborativeScores)
    {
        assert(contentScores.size() == collaborativeScores.size());

        std::vector<double> res(contentScores.size());
        for (std::size_t i{}; i < contentScores.size(); ++i)
            res[i] = weights.w0 * contentScores[i] + weights.w1 * collaborativeScores[i];

        return res;
    }

    std::vector<std::size_t> EnsembleRanker::sort(std::span<const CandidateListing> candidates, std::span<const double> finalScores)
    {
        assert(candidates.size() == finalScores.size());

        std::vector<std::size_t> res(candidates.size());
        std::iota(res.begin(), res.end(), 0);

        std::stable_sort(res.begin(), res.end(), [&](std::size_t lhs, std::size_t rhs) {
            if (finalScores[lhs] != finalScores[rhs])
                return finalScores[lhs] > finalScores[rhs];

            const CandidateListing& lhsCandidate{ candidates[lhs] };
            const CandidateListing& rhsCandidate{ candidates[rhs] };
            if (lhsCandidate.createdDateTime != rhsCandidate.createdDateTime)
                return lhsCandidate.createdDateTime > rhsCandidate.createdDateTime;
            if (lhsCandidate.distanceKm != rhsCandidate.distanceKm)
                return lhsCandidate.distanceKm < rhsCandidate.distanceKm;

            return lhsCandidate.hostReputation > rhsCandidate.hostReputation;
        });

        return res;
    }
} // namespace grouprank::ranking
