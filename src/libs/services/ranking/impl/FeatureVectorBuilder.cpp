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

#include "FeatureVectorBuilder.hpp"

namespace grouprank::ranking::features
{
    static_assert(featureVectorDimension == 38);

    FeatureVector buildUserVector(const UserProfileFeatures& profile)
    {
        FeatureVector res{};

        for (db::ListingCategory category : profile.interestedCategories)
        {
            if (static_cast<std::size_t>(category) < db::listingCategoryCount)
                res[categoryOffset + static_cast<std::size_t>(category)] = 1.0;
        }

        for (db::Market market : profile.wishMarkets)
        {
            if (static_cast<std::size_t>(market) < db::marketCount)
                res[marketOffset + static_cast<std::size_t>(market)] = 1.0;
        }

        for (std::size_t hour{}; hour < db::hourCount; ++hour)
        {
            if (profile.wishHours.test(hour))
                res[hourOffset + hour] = 1.0;
        }

        return res;
    }

    FeatureVector buildCandidateVector(const CandidateListing& candidate)
    {
        FeatureVector res{};

        if (candidate.category && static_cast<std::size_t>(*candidate.category) < db::listingCategoryCount)
            res[categoryOffset + static_cast<std::size_t>(*candidate.category)] = 1.0;

        if (candidate.market && static_cast<std::size_t>(*candidate.market) < db::marketCount)
            res[marketOffset + static_cast<std::size_t>(*candidate.market)] = 1.0;

        if (candidate.scheduledHour)
            res[hourOffset + (*candidate.scheduledHour % db::hourCount)] = 1.0;

        return res;
    }
} // namespace grouprank::ranking::features
