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

#include "RankingService.hpp"

#include <exception>
#include <iomanip>

#include "core/ILogger.hpp"
#include "services/ranking/IRankingDataSource.hpp"

namespace grouprank::ranking
{
    std::unique_ptr<IRankingService> createRankingService(IRankingDataSource& dataSource, const RankingSettings& settings, core::logging::ILogger& logger)
    {
        return std::make_unique<RankingService>(dataSource, settings, logger);
    }

    RankingService::RankingService(IRankingDataSource& dataSource, const RankingSettings& settings, core::logging::ILogger& logger)
        : _dataSource{ dataSource }
        , _settings{ settings }
        , _logger{ logger }
        , _contentScorer{ logger }
        , _collaborativeScorer{ dataSource, logger }
        , _historyStrengthEstimator{ settings.historyDecayDays, settings.historyReference }
        , _ensembleRanker{ settings.w1Min, settings.w1Max, settings.coverageThreshold }
    {
        _settings.validate();
    }

    RankingResult RankingService::rank(const RankingRequest& request) const
    {
        const Wt::WDateTime now{ request.now.isValid() ? request.now : Wt::WDateTime::currentDateTime() };

        GROUPRANK_LOG(_logger, RANKING, DEBUG, "Ranking for user " << (request.user.isValid() ? request.user.toString() : "<anonymous>") << ", radius = " << request.radiusKm << " km");

        RankingResult result;

        const std::vector<CandidateListing> candidates{ _dataSource.fetchCandidates(request.filters, request.location, request.radiusKm, now, _settings.candidateLimit) };
        if (candidates.empty())
        {
            GROUPRANK_LOG(_logger, RANKING, DEBUG, "No candidate found");
            if (request.withScores)
                result.scores.emplace();
            return result;
        }

        const std::optional<UserProfileFeatures> profile{ request.user.isValid() ? loadUserProfile(request.user) : std::nullopt };

        const std::vector<double> contentScores{ _contentScorer.computeScores(profile, candidates) };
        const std::vector<double> collaborativeScores{ _collaborativeScorer.computeScores(request.user, candidates, _settings.historyLimit) };
        const double historyStrength{ request.user.isValid() ? estimateHistoryStrength(request.user, now) : 0.0 };

        result.weights = _ensembleRanker.computeWeights(historyStrength, collaborativeScores);
        const std::vector<double> finalScores{ EnsembleRanker::computeFinalScores(result.weights, contentScores, collaborativeScores) };
        const std::vector<std::size_t> order{ EnsembleRanker::sort(candidates, finalScores) };

        result.totalCount = order.size();

        const std::span<const std::size_t> page{ EnsembleRanker::getPage(std::span<const std::size_t>{ order }, request.page, request.size) };
        result.listingIds.reserve(page.size());
        for (std::size_t index : page)
            result.listingIds.push_back(candidates[index].id);

        if (request.withScores)
        {
            result.scores.emplace();
            result.scores->reserve(page.size());
            for (std::size_t index : page)
                result.scores->push_back(ScoreBreakdown{ contentScores[index], collaborativeScores[index], finalScores[index] });
        }

        GROUPRANK_LOG(_logger, RANKING, DEBUG, "Ranked " << result.totalCount << " candidates, w0 = " << result.weights.w0 << ", w1 = " << result.weights.w1 << ", s = " << result.weights.historyStrength << ", coverage = " << result.weights.coverage);
        logScores(request, result);

        return result;
    }

    std::optional<UserProfileFeatures> RankingService::loadUserProfile(db::UserId user) const
    {
        try
        {
            return _dataSource.fetchUserProfile(user);
        }
        catch (const std::exception& e)
        {
            GROUPRANK_LOG(_logger, RANKING, WARNING, "Cannot load profile of user " << user.toString() << ", content scores disabled: " << e.what());
            return std::nullopt;
        }
    }

    double RankingService::estimateHistoryStrength(db::UserId user, const Wt::WDateTime& now) const
    {
        try
        {
            const std::vector<InteractionRecord> interactions{ _dataSource.fetchWeightedInteractions(user, _settings.interactionLimit) };
            return _historyStrengthEstimator.estimate(interactions, now);
        }
        catch (const std::exception& e)
        {
            GROUPRANK_LOG(_logger, RANKING, WARNING, "Cannot estimate history strength: " << e.what());
            return 0.0;
        }
    }

    void RankingService::logScores(const RankingRequest& request, const RankingResult& result) const
    {
        if (!result.scores || !_logger.isSeverityActive(core::logging::Severity::DEBUG))
            return;

        for (std::size_t i{}; i < result.listingIds.size(); ++i)
        {
            const ScoreBreakdown& score{ (*result.scores)[i] };
            GROUPRANK_LOG(_logger, RANKING, DEBUG, "Page " << request.page << " [" << i + 1 << "] listing " << result.listingIds[i].toString() << std::fixed << std::setprecision(4) << ": final = " << score.final << " (v0 = " << score.v0 << ", v1 = " << score.v1 << ")");
        }
    }
} // namespace grouprank::ranking
