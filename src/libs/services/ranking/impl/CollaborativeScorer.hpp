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

#include <cstddef>
#include <span>
#include <vector>

#include "database/objects/UserId.hpp"
#include "services/ranking/Types.hpp"

namespace grouprank::core::logging
{
    class ILogger;
}

namespace grouprank::ranking
{
    class IRankingDataSource;

    // V1: max precomputed similarity between each candidate and the user history
    class CollaborativeScorer
    {
    public:
        CollaborativeScorer(IRankingDataSource& dataSource, core::logging::ILogger& logger);

        // one score in [0, 1] per candidate
        // Never throws: all scores are zero if the history or the similarities cannot be fetched
        std::vector<double> computeScores(db::UserId user, std::span<const CandidateListing> candidates, std::size_t historyLimit) const;

    private:
        IRankingDataSource& _dataSource;
        core::logging::ILogger& _logger;
    };
} // namespace grouprank::ranking
