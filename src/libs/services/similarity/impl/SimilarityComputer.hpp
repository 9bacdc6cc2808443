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

#include <span>
#include <vector>

#include "database/objects/ItemItemSimilarity.hpp"
#include "database/objects/ListingId.hpp"
#include "database/objects/UserId.hpp"

namespace grouprank::similarity
{
    struct SimilarityBuilderSettings;

    struct WeightedInteraction
    {
        db::UserId user;
        db::ListingId listing;
        double weight{};
    };

    struct SimilarityComputeResult
    {
        std::size_t userCount{};
        std::size_t itemCount{};
        // ordered by source, similarity desc, then neighbor
        std::vector<db::ItemItemSimilarity::Entry> entries;
    };

    // Pairs with the same (user, listing) have their weights summed
    // Each kept pair is reported in both directions, then each source keeps its topK best neighbors
    SimilarityComputeResult computeItemItemSimilarities(std::span<const WeightedInteraction> interactions, const SimilarityBuilderSettings& settings);

    // sim_bayes = common / (common + lambda) * cosine
    double computeSmoothedSimilarity(double cosine, std::size_t commonUserCount, double lambda);
} // namespace grouprank::similarity
