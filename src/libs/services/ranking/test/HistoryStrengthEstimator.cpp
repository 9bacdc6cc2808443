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

#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "HistoryStrengthEstimator.hpp"

namespace grouprank::ranking::tests
{
    namespace
    {
        const Wt::WDateTime now{ Wt::WDate{ 2025, 6, 1 }, Wt::WTime{ 12, 0 } };

        InteractionRecord createInteraction(double weight, int ageInDays)
        {
            return InteractionRecord{ db::ListingId{ 1 }, db::InteractionSignal::Weak, weight, now.addDays(-ageInDays) };
        }
    } // namespace

    TEST(HistoryStrengthEstimator, noHistory)
    {
        const HistoryStrengthEstimator estimator{ 30, 10 };
        EXPECT_EQ(estimator.estimate({}, now), 0.0);
    }

    TEST(HistoryStrengthEstimator, decay)
    {
        const HistoryStrengthEstimator estimator{ 30, 10 };

        {
            const std::vector<InteractionRecord> interactions{ createInteraction(2.0, 0) };
            EXPECT_NEAR(estimator.estimate(interactions, now), 0.2, 1e-9);
        }

        {
            const std::vector<InteractionRecord> interactions{ createInteraction(2.0, 30) };
            EXPECT_NEAR(estimator.estimate(interactions, now), 0.2 * std::exp(-1.0), 1e-9);
        }

        {
            const std::vector<InteractionRecord> interactions{ createInteraction(1.0, 0), createInteraction(0.5, 60) };
            EXPECT_NEAR(estimator.estimate(interactions, now), (1.0 + 0.5 * std::exp(-2.0)) / 10, 1e-9);
        }
    }

    TEST(HistoryStrengthEstimator, clipped)
    {
        const HistoryStrengthEstimator estimator{ 30, 10 };

        const std::vector<InteractionRecord> interactions(20, createInteraction(2.0, 0));
        EXPECT_DOUBLE_EQ(estimator.estimate(interactions, now), 1.0);
    }

    TEST(HistoryStrengthEstimator, futureEvents)
    {
        const HistoryStrengthEstimator estimator{ 30, 10 };

        const std::vector<InteractionRecord> future{ createInteraction(2.0, -5) };
        const std::vector<InteractionRecord> present{ createInteraction(2.0, 0) };
        EXPECT_DOUBLE_EQ(estimator.estimate(future, now), estimator.estimate(present, now));
    }

    TEST(HistoryStrengthEstimator, monotonicity)
    {
        const HistoryStrengthEstimator estimator{ 30, 10 };

        double previous{ -1 };
        for (double weight : { 0.5, 1.0, 2.0, 4.0 })
        {
            const std::vector<InteractionRecord> interactions{ createInteraction(weight, 10), createInteraction(1.0, 3) };
            const double strength{ estimator.estimate(interactions, now) };
            EXPECT_GE(strength, previous);
            EXPECT_GE(strength, 0.0);
            EXPECT_LE(strength, 1.0);
            previous = strength;
        }

        previous = 2;
        for (int age : { 0, 1, 10, 100, 1000 })
        {
            const std::vector<InteractionRecord> interactions{ createInteraction(2.0, age) };
            const double strength{ estimator.estimate(interactions, now) };
            EXPECT_LE(strength, previous);
            previous = strength;
        }
    }
} // namespace grouprank::ranking::tests
