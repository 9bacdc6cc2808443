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

#include "Common.hpp"

namespace grouprank::db::tests
{
    TEST_F(DatabaseFixture, User)
    {
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_TRUE(User::find(session, User::FindParameters{}).results.empty());
            EXPECT_EQ(User::getCount(session), 0);
        }

        ScopedUser user1{ session, "MyUser1" };
        ScopedUser user2{ session, "MyUser2" };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(User::getCount(session), 2);

            const auto users{ User::find(session, User::FindParameters{}) };
            ASSERT_EQ(users.results.size(), 2);
            EXPECT_EQ(users.results[0], user1.getId());
            EXPECT_EQ(users.results[1], user2.getId());
            EXPECT_FALSE(users.moreResults);
        }

        {
            auto transaction{ session.createReadTransaction() };

            const auto users{ User::find(session, User::FindParameters{}.setRange(Range{ 0, 1 })) };
            ASSERT_EQ(users.results.size(), 1);
            EXPECT_EQ(users.results[0], user1.getId());
            EXPECT_TRUE(users.moreResults);
        }
    }

    TEST_F(DatabaseFixture, User_findByLoginName)
    {
        ScopedUser user{ session, "MyUser" };

        auto transaction{ session.createReadTransaction() };

        const User::pointer found{ User::find(session, "MyUser") };
        ASSERT_TRUE(found);
        EXPECT_EQ(found->getId(), user.getId());
        EXPECT_EQ(found->getLoginName(), "MyUser");

        EXPECT_FALSE(User::find(session, "NotMyUser"));
    }

    TEST_F(DatabaseFixture, User_profile)
    {
        ScopedUser user{ session, "MyUser" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_TRUE(user->getInterestedCategories().empty());
            EXPECT_TRUE(user->getWishMarkets().empty());
            EXPECT_TRUE(user->getWishHours().none());
        }

        HourMask wishHours;
        wishHours.set(0);
        wishHours.set(18);
        wishHours.set(23);

        {
            auto transaction{ session.createWriteTransaction() };

            user.get().modify()->setInterestedCategories({ ListingCategory::FoodAndSnacks, ListingCategory::BeautyAndHealthcare });
            user.get().modify()->setWishMarkets({ Market::Costco, Market::Other });
            user.get().modify()->setWishHours(wishHours);
        }

        {
            auto transaction{ session.createReadTransaction() };

            const ListingCategorySet expectedCategories{ ListingCategory::FoodAndSnacks, ListingCategory::BeautyAndHealthcare };
            EXPECT_EQ(user->getInterestedCategories(), expectedCategories);

            const MarketSet expectedMarkets{ Market::Costco, Market::Other };
            EXPECT_EQ(user->getWishMarkets(), expectedMarkets);

            EXPECT_EQ(user->getWishHours(), wishHours);
            EXPECT_EQ(user->getWishHours().count(), 3);
        }
    }
} // namespace grouprank::db::tests
