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
    TEST_F(DatabaseFixture, Participation)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser user{ session, "MyUser" };
        ScopedListing listing{ session, host.lockAndGet(), "MyListing" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Participation::getCount(session), 0);
            EXPECT_FALSE(Participation::find(session, user.getId(), listing.getId()));
        }

        ScopedParticipation participation{ session, user.lockAndGet(), listing.lockAndGet(), getNow() };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(Participation::getCount(session), 1);

            const Participation::pointer found{ Participation::find(session, user.getId(), listing.getId()) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), participation.getId());
            EXPECT_EQ(found->getUserId(), user.getId());
            EXPECT_EQ(found->getListingId(), listing.getId());
            EXPECT_EQ(found->getStatus(), ParticipationStatus::Applied);
            EXPECT_EQ(found->getAppliedDateTime(), getNow());
            EXPECT_FALSE(found->getDecidedDateTime().isValid());

            EXPECT_FALSE(Participation::find(session, host.getId(), listing.getId()));
        }

        {
            auto transaction{ session.createWriteTransaction() };
            participation.get().modify()->setStatus(ParticipationStatus::Accepted, getNow().addDays(1));
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(participation->getStatus(), ParticipationStatus::Accepted);
            EXPECT_EQ(participation->getDecidedDateTime(), getNow().addDays(1));
        }

        {
            auto transaction{ session.createWriteTransaction() };
            participation.get().modify()->setStatus(ParticipationStatus::Applied, getNow().addDays(2));
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(participation->getStatus(), ParticipationStatus::Applied);
            EXPECT_FALSE(participation->getDecidedDateTime().isValid());
        }
    }

    TEST_F(DatabaseFixture, Favorite)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser user{ session, "MyUser" };
        ScopedListing listing{ session, host.lockAndGet(), "MyListing" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Favorite::getCount(session), 0);
        }

        ScopedFavorite favorite{ session, user.lockAndGet(), listing.lockAndGet(), getNow() };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(Favorite::getCount(session), 1);

            const Favorite::pointer found{ Favorite::find(session, user.getId(), listing.getId()) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), favorite.getId());
            EXPECT_EQ(found->getCreatedDateTime(), getNow());
        }

        // removing the listing removes its favorites
        {
            auto transaction{ session.createWriteTransaction() };
            listing.get().remove();
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Favorite::getCount(session), 0);
        }
    }
} // namespace grouprank::db::tests
