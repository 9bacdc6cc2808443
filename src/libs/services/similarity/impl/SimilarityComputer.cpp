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

#include "SimilarityComputer.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

#include "services/similarity/SimilarityBuilderSettings.hpp"

namespace grouprank::similarity
{
    namespace
    {
        using ListingPair = std::pair<db::ListingId, db::ListingId>; // first < second

        struct ListingPairHash
        {
            std::size_t operator()(const ListingPair& pair) const
            {
                const std::size_t h1{ std::hash<db::ListingId>{}(pair.first) };
                const std::size_t h2{ std::hash<db::ListingId>{}(pair.second) };
                return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
            }
        };

        struct PairAccumulator
        {
            double dotProduct{};
            std::size_t commonUserCount{};
        };

        struct UserItem
        {
            db::ListingId listing;
            double weight{};
        };

        // users are kept ordered to get a deterministic accumulation order
        std::map<db::UserId, std::vector<UserItem>> groupByUser(std::span<const WeightedInteraction> interactions)
        {
            std::map<db::UserId, std::vector<UserItem>> res;

            for (const WeightedInteraction& interaction : interactions)
                res[interaction.user].push_back(UserItem{ interaction.listing, interaction.weight });

            for (auto& [user, items] : res)
            {
                std::sort(std::begin(items), std::end(items), [](const UserItem& lhs, const UserItem& rhs) { return lhs.listing < rhs.listing; });

                // merge duplicates
                std::vector<UserItem> merged;
                merged.reserve(items.size());
                for (const UserItem& item : items)
                {
                    if (!merged.empty() && merged.back().listing == item.listing)
                        merged.back().weight += item.weight;
                    else
                        merged.push_back(item);
                }
                items = std::move(merged);
            }

            return res;
        }

        bool isBetterNeighbor(const db::ItemItemSimilarity::Entry& lhs, const db::ItemItemSimilarity::Entry& rhs)
        {
            if (lhs.similarity != rhs.similarity)
                return lhs.similarity > rhs.similarity;
            return lhs.neighbor < rhs.neighbor;
        }
    } // namespace

    double computeSmoothedSimilarity(double cosine, std::size_t commonUserCount, double lambda)
    {
        const double common{ static_cast<double>(commonUserCount) };
        if (common + lambda <= 0)
            return 0;

        return common / (common + lambda) * cosine;
    }

    SimilarityComputeResult computeItemItemSimilarities(std::span<const WeightedInteraction> interactions, const SimilarityBuilderSettings& settings)
    {
        SimilarityComputeResult result;

        const std::map<db::UserId, std::vector<UserItem>> itemsByUser{ groupByUser(interactions) };
        result.userCount = itemsByUser.size();

        std::unordered_map<db::ListingId, double> squaredNorms;
        std::unordered_map<ListingPair, PairAccumulator, ListingPairHash> pairs;

        for (const auto& [user, items] : itemsByUser)
        {
            for (std::size_t i{}; i < items.size(); ++i)
            {
                squaredNorms[items[i].listing] += items[i].weight * items[i].weight;

                for (std::size_t j{ i + 1 }; j < items.size(); ++j)
                {
                    PairAccumulator& accumulator{ pairs[ListingPair{ items[i].listing, items[j].listing }] };
                    accumulator.dotProduct += items[i].weight * items[j].weight;
                    accumulator.commonUserCount += 1;
                }
            }
        }
        result.itemCount = squaredNorms.size();

        std::map<db::ListingId, std::vector<db::ItemItemSimilarity::Entry>> neighborsBySource;
        for (const auto& [pair, accumulator] : pairs)
        {
            if (accumulator.commonUserCount < settings.minCommon)
                continue;

            const double normProduct{ std::sqrt(squaredNorms[pair.first]) * std::sqrt(squaredNorms[pair.second]) };
            if (normProduct <= 0)
                continue;

            const double cosine{ std::clamp(accumulator.dotProduct / normProduct, 0.0, 1.0) };
            const double similarity{ computeSmoothedSimilarity(cosine, accumulator.commonUserCount, settings.lambda) };
            if (similarity < settings.minSimilarity)
                continue;

            neighborsBySource[pair.first].push_back(db::ItemItemSimilarity::Entry{ pair.first, pair.second, similarity, accumulator.commonUserCount });
            neighborsBySource[pair.second].push_back(db::ItemItemSimilarity::Entry{ pair.second, pair.first, similarity, accumulator.commonUserCount });
        }

        for (auto& [source, neighbors] : neighborsBySource)
        {
            std::sort(std::begin(neighbors), std::end(neighbors), isBetterNeighbor);
            // per source cut: the reverse row of a kept pair may be dropped
            if (neighbors.size() > settings.topK)
                neighbors.resize(settings.topK);

            result.entries.insert(std::end(result.entries), std::cbegin(neighbors), std::cend(neighbors));
        }

        return result;
    }
} // namespace grouprank::similarity
