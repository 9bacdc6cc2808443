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
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include <Wt/WDateTime.h>

#include "database/objects/ListingId.hpp"
#include "database/objects/UserId.hpp"
#include "services/ranking/Types.hpp"

namespace grouprank::core::logging
{
    class ILogger;
}

namespace grouprank::db
{
    class IDb;
}

namespace grouprank::ranking
{
    // Read-only access to the data needed to rank listings
    // Implementations must be usable concurrently from several threads
    class IRankingDataSource
    {
    public:
        virtual ~IRankingDataSource() = default;

        // Recruiting listings scheduled strictly after now, within radiusKm of location, most recently created first
        virtual std::vector<CandidateListing> fetchCandidates(const CandidateFilters& filters, const GeoPoint& location, double radiusKm, const Wt::WDateTime& now, std::size_t limit) = 0;

        virtual std::optional<UserProfileFeatures> fetchUserProfile(db::UserId user) = 0;

        // Favorited, accepted or fulfilled listings, most recent first, without duplicates
        virtual std::vector<db::ListingId> fetchUserHistory(db::UserId user, std::size_t limit) = 0;

        // All signals, most recent first
        virtual std::vector<InteractionRecord> fetchWeightedInteractions(db::UserId user, std::size_t limit) = 0;

        // For each candidate, max similarity across the history listings. Candidates without similarity are not reported
        // May throw if the similarity cache is not available
        virtual std::unordered_map<db::ListingId, double> fetchSimilarity(std::span<const db::ListingId> candidates, std::span<const db::ListingId> history) = 0;
    };

    std::unique_ptr<IRankingDataSource> createDbRankingDataSource(db::IDb& db, core::logging::ILogger& logger);
} // namespace grouprank::ranking
