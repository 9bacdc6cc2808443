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

#include <algorithm>
#include <numeric>

#include <gtest/gtest.h>

#include "FeatureVectorBuilder.hpp"

namespace grouprank::ranking::tests
{
    namespace
    {
        double sum(const features::FeatureVector& vector)
        {
            return std::accumulate(vector.cbegin(), vector.cend(), 0.0);
        }
    } // namespace

    TEST(FeatureVectorBuilder, userVector)
    {
        UserProfileFeatures profile;
        profile.interestedCategories = { db::ListingCategory::Household, db::ListingCategory::BeautyAndHealthcare };
        profile.wishMarkets = { db::Market::Costco, db::Market::ECommerce };
        profile.wishHours.set(9);
        profile.wishHours.set(20);

        const features::FeatureVector vector{ features::buildUserVector(profile) };
        EXPECT_EQ(vector.size(), 38);
        EXPECT_DOUBLE_EQ(sum(vector), 6.0);

        EXPECT_DOUBLE_EQ(vector[features::categoryOffset + 0], 1.0);
        EXPECT_DOUBLE_EQ(vector[features::categoryOffset + 3], 1.0);
        EXPECT_DOUBLE_EQ(vector[features::marketOffset + 0], 1.0);
        EXPECT_DOUBLE_EQ(vector[features::marketOffset + 8], 1.0);
        EXPECT_DOUBLE_EQ(vector[features::hourOffset + 9], 1.0);
        EXPECT_DOUBLE_EQ(vector[features::hourOffset + 20], 1.0);
    }

    TEST(FeatureVectorBuilder, emptyUserVector)
    {
        const features::FeatureVector vector{ features::buildUserVector(UserProfileFeatures{}) };
        EXPECT_TRUE(std::all_of(vector.cbegin(), vector.cend(), [](double value) { return value == 0.0; }));
    }

    TEST(FeatureVectorBuilder, candidateVector)
    {
        CandidateListing candidate;
        candidate.category = db::ListingCategory::FoodAndSnacks;
        candidate.market = db::Market::Other;
        candidate.scheduledHour = 23;

        const features::FeatureVector vector{ features::buildCandidateVector(candidate) };
        EXPECT_DOUBLE_EQ(sum(vector), 3.0);
        EXPECT_DOUBLE_EQ(vector[features::categoryOffset + 1], 1.0);
        EXPECT_DOUBLE_EQ(vector[features::marketOffset + 9], 1.0);
        EXPECT_DOUBLE_EQ(vector[features::hourOffset + 23], 1.0);
    }

    TEST(FeatureVectorBuilder, candidateVectorMissingValues)
    {
        CandidateListing candidate;
        candidate.market = db::Market::Traders;

        const features::FeatureVector vector{ features::buildCandidateVector(candidate) };
        EXPECT_DOUBLE_EQ(sum(vector), 1.0);
        EXPECT_DOUBLE_EQ(vector[features::marketOffset + 2], 1.0);
    }
} // namespace grouprank::ranking::tests
