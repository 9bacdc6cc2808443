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

#include "services/ranking/IRankingDataSource.hpp"

namespace grouprank::ranking
{
    class DbRankingDataSource : public IRankingDataSource
    {
    public:
        DbRankingDataSource(db::IDb& db, core::logging::ILogger& logger);
        ~DbRankingDataSource() override = default;
        DbRankingDataSource(const DbRankingDataSource&) = delete;
        DbRankingDataSource& operator=(const DbRankingDataSource&) = delete;

    private:
        std::vector<CandidateListing> fetchCandidates(const CandidateFilters& filters, const GeoPoint& location, double radiusKm, const Wt::WDateTime& now, std::size_t limit) override;
        std::optional<UserProfileFeatures> fetchUserProfile(db::UserId user) override;
        std::vector<db::ListingId> fetchUserHistory(db::UserId user, std::size_t limit) override;
        std::vector<InteractionRecord> fetchWeightedInteractions(db::UserId user, std::size_t limit) override;
        std::unordered_map<db::ListingId, double> fetchSimilarity(std::span<const db::ListingId> candidates, std::span<const db::ListingId> history) override;

        db::IDb& _db;
        core::logging::ILogger& _logger;
    };
} // namespace grouprank::ranking
