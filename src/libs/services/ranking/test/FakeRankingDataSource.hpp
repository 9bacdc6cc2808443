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
#include <map>
#include <stdexcept>
#include <utility>

#include "services/ranking/IRankingDataSource.hpp"

namespace grouprank::ranking::tests
{
    // In memory data source, candidates are returned in insertion order
    class FakeRankingDataSource : public IRankingDataSource
    {
    public:
        std::vector<CandidateListing> candidates;
        std::map<db::UserId, UserProfileFeatures> profiles;
        std::map<db::UserId, std::vector<db::ListingId>> histories;
        std::map<db::UserId, std::vector<InteractionRecord>> interactions;
        std::map<std::pair<db::ListingId, db::ListingId>, double> similarities; // (candidate, history)
        bool similarityAvailable{ true };
        bool profilesAvailable{ true };
        bool interactionsAvailable{ true };

        std::vector<CandidateListing> fetchCandidates(const CandidateFilters&, const GeoPoint&, double, const Wt::WDateTime&, std::size_t limit) override
        {
            std::vector<CandidateListing> res{ candidates };
            if (res.size() > limit)
                res.resize(limit);
            return res;
        }

        std::optional<UserProfileFeatures> fetchUserProfile(db::UserId user) override
        {
            if (!profilesAvailable)
                throw std::runtime_error{ "database is locked" };

            if (const auto it{ profiles.find(user) }; it != std::cend(profiles))
                return it->second;
            return std::nullopt;
        }

        std::vector<db::ListingId> fetchUserHistory(db::UserId user, std::size_t limit) override
        {
            std::vector<db::ListingId> res;
            if (const auto it{ histories.find(user) }; it != std::cend(histories))
                res = it->second;
            if (res.size() > limit)
                res.resize(limit);
            return res;
        }

        std::vector<InteractionRecord> fetchWeightedInteractions(db::UserId user, std::size_t limit) override
        {
            if (!interactionsAvailable)
                throw std::runtime_error{ "database is locked" };

            std::vector<InteractionRecord> res;
            if (const auto it{ interactions.find(user) }; it != std::cend(interactions))
                res = it->second;
            if (res.size() > limit)
                res.resize(limit);
            return res;
        }

        std::unordered_map<db::ListingId, double> fetchSimilarity(std::span<const db::ListingId> candidateIds, std::span<const db::ListingId> history) override
        {
            if (!similarityAvailable)
                throw std::runtime_error{ "no such table: item_item_similarity" };

            std::unordered_map<db::ListingId, double> res;
            for (db::ListingId candidate : candidateIds)
            {
                for (db::ListingId historyItem : history)
                {
                    if (const auto it{ similarities.find({ candidate, historyItem }) }; it != std::cend(similarities))
                    {
                        double& score{ res[candidate] };
                        score = std::max(score, it->second);
                    }
                }
            }
            return res;
        }
    };
} // namespace grouprank::ranking::tests
