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

#include <optional>

#include "services/ranking/IRankingService.hpp"
#include "services/ranking/RankingSettings.hpp"

#include "CollaborativeScorer.hpp"
#include "ContentScorer.hpp"
#include "EnsembleRanker.hpp"
#include "HistoryStrengthEstimator.hpp"

namespace grouprank::ranking
{
    class RankingService : public IRankingService
    {
    public:
        RankingService(IRankingDataSource& dataSource, const RankingSettings& settings, core::logging::ILogger& logger);
        ~RankingService() override = default;
        RankingService(const RankingService&) = delete;
        RankingService& operator=(const RankingService&) = delete;

    private:
        RankingResult rank(const RankingRequest& request) const override;

        std::optional<UserProfileFeatures> loadUserProfile(db::UserId user) const;
        double estimateHistoryStrength(db::UserId user, const Wt::WDateTime& now) const;
        void logScores(const RankingRequest& request, const RankingResult& result) const;

        IRankingDataSource& _dataSource;
        const RankingSettings _settings;
        core::logging::ILogger& _logger;

        const ContentScorer _contentScorer;
        const CollaborativeScorer _collaborativeScorer;
        const HistoryStrengthEstimator _historyStrengthEstimator;
        const EnsembleRanker _ensembleRanker;
    };
} // namespace grouprank::ranking
