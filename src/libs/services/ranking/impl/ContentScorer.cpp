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

#include "ContentScorer.hpp"

#include <algorithm>

#include "core/ILogger.hpp"

#include "FeatureVectorBuilder.hpp"
#include "ScoreUtils.hpp"

namespace grouprank::ranking
{
    ContentScorer::ContentScorer(core::logging::ILogger& logger)
        : _logger{ logger }
    {
    }

    std::vector<double> ContentScorer::computeScores(const std::optional<UserProfileFeatures>& profile, std::span<const CandidateListing> candidates) const
    {
        std::vector<double> res(candidates.size(), 0.0);

        if (!profile)
        {
            GROUPRANK_LOG(_logger, RANKING, DEBUG, "Content scores disabled: no user profile");
            return res;
        }

        const features::FeatureVector userVector{ features::buildUserVector(*profile) };
        for (std::size_t i{}; i < candidates.size(); ++i)
        {
            const features::FeatureVector candidateVector{ features::buildCandidateVector(candidates[i]) };
            res[i] = scores::computeCosineSimilarity(userVector, candidateVector);
        }

        scores::minMaxNormalize(res);

        GROUPRANK_LOG(_logger, RANKING, DEBUG, "Content scores: " << std::count_if(res.cbegin(), res.cend(), [](double score) { return score > 0; }) << "/" << res.size() << " candidates with non zero score");

        return res;
    }
} // namespace grouprank::ranking
