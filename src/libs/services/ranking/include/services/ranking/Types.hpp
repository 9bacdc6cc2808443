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
#include <optional>
#include <vector>

#include <Wt/WDateTime.h>

#include "database/Types.hpp"
#include "database/objects/ListingId.hpp"
#include "database/objects/UserId.hpp"

namespace grouprank::ranking
{
    struct GeoPoint
    {
        double latitude{};
        double longitude{};
    };

    struct CandidateFilters
    {
        std::optional<db::ListingCategory> category;
        std::optional<db::Market> market;
    };

    struct UserProfileFeatures
    {
        db::ListingCategorySet interestedCategories;
        db::MarketSet wishMarkets;
        db::HourMask wishHours;
    };

    struct CandidateListing
    {
        db::ListingId id;
        std::optional<db::ListingCategory> category;
        std::optional<db::Market> market;
        std::optional<unsigned> scheduledHour; // [0, 23]
        double distanceKm{};
        Wt::WDateTime createdDateTime;
        double hostReputation{ 0.5 }; // [0, 1]
    };

    struct InteractionRecord
    {
        db::ListingId listing;
        db::InteractionSignal signal;
        double weight{};
        Wt::WDateTime dateTime;
    };

    struct RankingRequest
    {
        db::UserId user; // invalid for anonymous requests
        GeoPoint location;
        double radiusKm{ 3.0 };
        CandidateFilters filters;
        std::size_t page{ 1 }; // starts at 1
        std::size_t size{ 20 };
        bool withScores{};
        Wt::WDateTime now; // current time if not set
    };

    // Weights effectively applied to compute final scores
    struct RankingWeights
    {
        double w0{ 1.0 };
        double w1{};
        double historyStrength{};
        double coverage{};
    };

    struct ScoreBreakdown
    {
        double v0{};
        double v1{};
        double final{};
    };

    using ListingContainer = std::vector<db::ListingId>;

    struct RankingResult
    {
        ListingContainer listingIds; // requested page
        std::size_t totalCount{};    // count of ranked candidates across all pages
        RankingWeights weights;
        std::optional<std::vector<ScoreBreakdown>> scores; // one per returned listing, if requested
    };
} // namespace grouprank::ranking
