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

#include "SimilarityBuilderService.hpp"

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Interaction.hpp"

namespace grouprank::similarity
{
    std::unique_ptr<ISimilarityBuilderService> createSimilarityBuilderService(db::IDb& db, const SimilarityBuilderSettings& settings, core::logging::ILogger& logger)
    {
        return std::make_unique<SimilarityBuilderService>(db, settings, logger);
    }

    SimilarityBuilderService::SimilarityBuilderService(db::IDb& db, const SimilarityBuilderSettings& settings, core::logging::ILogger& logger)
        : _db{ db }
        , _settings{ settings }
        , _logger{ logger }
    {
        _settings.validate();
    }

    SimilarityBuildReport SimilarityBuilderService::run()
    {
        const auto start{ std::chrono::steady_clock::now() };

        GROUPRANK_LOG(_logger, SIMILARITY, INFO, "Building item-item similarities: topK = " << _settings.topK << ", minCommon = " << _settings.minCommon << ", minSim = " << _settings.minSimilarity << ", lambda = " << _settings.lambda);

        SimilarityBuildReport report;

        const std::vector<WeightedInteraction> interactions{ loadInteractions() };
        report.interactionCount = interactions.size();
        GROUPRANK_LOG(_logger, SIMILARITY, DEBUG, "Loaded " << interactions.size() << " (user, listing) pairs");

        const SimilarityComputeResult computeResult{ computeItemItemSimilarities(interactions, _settings) };
        report.userCount = computeResult.userCount;
        report.itemCount = computeResult.itemCount;
        report.storedPairCount = computeResult.entries.size();

        if (computeResult.entries.empty())
            GROUPRANK_LOG(_logger, SIMILARITY, WARNING, "No similarity passed the thresholds, the similarity cache will be empty");

        storeSimilarities(computeResult.entries);

        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

        GROUPRANK_LOG(_logger, SIMILARITY, INFO, "Similarity build complete: " << report.interactionCount << " pairs, " << report.userCount << " users, " << report.itemCount << " listings, " << report.storedPairCount << " similarities stored in " << report.elapsed.count() << " ms");

        return report;
    }

    std::vector<WeightedInteraction> SimilarityBuilderService::loadInteractions()
    {
        std::vector<WeightedInteraction> interactions;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        std::optional<std::size_t> limit;
        if (_settings.interactionLimit > 0)
            limit = _settings.interactionLimit;

        db::Interaction::visitAggregatedWeights(session, limit, [&](db::UserId user, db::ListingId listing, double weight) {
            interactions.push_back(WeightedInteraction{ user, listing, weight });
        });

        return interactions;
    }

    void SimilarityBuilderService::storeSimilarities(std::span<const db::ItemItemSimilarity::Entry> entries)
    {
        db::Session& session{ _db.getTLSSession() };

        // readers either see the previous cache or the new one
        auto transaction{ session.createWriteTransaction() };

        db::ItemItemSimilarity::clear(session);
        db::ItemItemSimilarity::insert(session, entries, Wt::WDateTime::currentDateTime());

        GROUPRANK_LOG(_logger, SIMILARITY, DEBUG, "Stored " << entries.size() << " similarities");
    }
} // namespace grouprank::similarity
