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

#include "CollaborativeScorer.hpp"

#include <algorithm>
#include <exception>

#include "core/ILogger.hpp"
#include "services/ranking/IRankingDataSource.hpp"

#include "ScoreUtils.hpp"

namespace grouprank::ranking
{
    CollaborativeScorer::CollaborativeScorer(IRankingDataSource& dataSource, core::logging::ILogger& logger)
        : _dataSource{ dataSource }
        , _logger{ logger }
    {
    }

    std::vector<double> CollaborativeScorer::computeScores(db::UserId user, std::span<const CandidateListing> candidates, std::size_t historyLimit) const
    {
        std::vector<double> res(candidates.size(), 0.0);
        if (!user.isValid() || candidates.empty())
            return res;

        try
        {
            const std::vector<db::ListingId> history{ _dataSource.fetchUserHistory(user, historyLimit) };
            if (history.empty())
            {
                GROUPRANK_LOG(_logger, RANKING, DEBUG, "Collaborative scores disabled: user has no history");
                return res;
            }

            std::vector<db::ListingId> candidateIds;
            candidateIds.reserve(candidates.size());
            for (const CandidateListing& candidate : candidates)
                candidateIds.push_back(candidate.id);

            const auto similarities{ _dataSource.fetchSimilarity(candidateIds, history) };
            for (std::size_t i{}; i < candidates.size(); ++i)
            {
                if (const auto it{ similarities.find(candidates[i].id) }; it != std::cend(similarities))
                    res[i] = it->second;
            }

            GROUPRANK_LOG(_logger, RANKING, DEBUG, "Collaborative scores: history size = " << history.size() << ", " << similarities.size() << "/" << candidates.size() << " candidates with similarity");
        }
        catch (const std::exception& e)
        {
            GROUPRANK_LOG(_logger, RANKING, WARNING, "Collaborative scores disabled: cannot fetch similarities: " << e.what());
            std::fill(res.begin(), res.end(), 0.0);
            return res;
        }

        scores::minMaxNormalize(res);

        return res;
    }
} // namespace grouprank::ranking
