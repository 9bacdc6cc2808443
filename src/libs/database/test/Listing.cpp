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

#include <vector>

namespace grouprank::db::tests
{
    namespace
    {
        struct ListingSetup
        {
            ListingCategory category{ ListingCategory::Household };
            Market market{ Market::Costco };
            ListingStatus status{ ListingStatus::Recruiting };
            double latitude{ 37.5665 };
            double longitude{ 126.9780 };
            Wt::WDateTime scheduledDateTime{ getNow().addDays(2) };
            Wt::WDateTime createdDateTime{ getNow().addDays(-1) };
        };

        void setupListing(Session& session, ScopedListing& listing, const ListingSetup& setup)
        {
            auto transaction{ session.createWriteTransaction() };

            auto l{ listing.get().modify() };
            l->setCategory(setup.category);
            l->setMarket(setup.market);
            l->setStatus(setup.status);
            l->setLocation(setup.latitude, setup.longitude);
            l->setScheduledDateTime(setup.scheduledDateTime);
            l->setCreatedDateTime(setup.createdDateTime);
        }

        std::vector<ListingId> findCandidateIds(Session& session, const Listing::CandidateFindParameters& params)
        {
            std::vector<ListingId> res;

            auto transaction{ session.createReadTransaction() };
            Listing::findCandidates(session, params, [&](const Listing::CandidateEntry& entry) {
                res.push_back(entry.id);
                return true;
            });

            return res;
        }
    } // namespace

    TEST_F(DatabaseFixture, Listing)
    {
        ScopedUser host{ session, "MyHost" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Listing::getCount(session), 0);
        }

        ScopedListing listing{ session, host.lockAndGet(), "MyListing" };
        setupListing(session, listing, ListingSetup{ .category = ListingCategory::FoodAndSnacks, .market = Market::Traders });

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(Listing::getCount(session), 1);
            EXPECT_EQ(listing->getTitle(), "MyListing");
            EXPECT_EQ(listing->getHostId(), host.getId());
            EXPECT_EQ(listing->getCategory(), ListingCategory::FoodAndSnacks);
            EXPECT_EQ(listing->getMarket(), Market::Traders);
            EXPECT_EQ(listing->getStatus(), ListingStatus::Recruiting);
            EXPECT_EQ(listing->getScheduledDateTime(), getNow().addDays(2));
        }

        {
            auto transaction{ session.createReadTransaction() };

            const auto listings{ Listing::find(session, Listing::FindParameters{}.setHost(host.getId())) };
            ASSERT_EQ(listings.results.size(), 1);
            EXPECT_EQ(listings.results.front(), listing.getId());

            EXPECT_TRUE(Listing::find(session, Listing::FindParameters{}.setStatus(ListingStatus::Completed)).results.empty());
        }
    }

    TEST_F(DatabaseFixture, Listing_cascadeOnHostRemoval)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedListing listing{ session, host.lockAndGet(), "MyListing" };

        {
            auto transaction{ session.createWriteTransaction() };
            host.get().remove();
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Listing::getCount(session), 0);
        }
    }

    TEST_F(DatabaseFixture, Listing_candidatesStatusAndSchedule)
    {
        ScopedUser host{ session, "MyHost" };

        ScopedListing recruiting{ session, host.lockAndGet(), "Recruiting" };
        setupListing(session, recruiting, ListingSetup{});

        ScopedListing locked{ session, host.lockAndGet(), "Locked" };
        setupListing(session, locked, ListingSetup{ .status = ListingStatus::Locked });

        ScopedListing past{ session, host.lockAndGet(), "Past" };
        setupListing(session, past, ListingSetup{ .scheduledDateTime = getNow().addSecs(-3600) });

        ScopedListing now{ session, host.lockAndGet(), "Now" };
        setupListing(session, now, ListingSetup{ .scheduledDateTime = getNow() });

        {
            const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}.setScheduledAfter(getNow())) };
            ASSERT_EQ(ids.size(), 1);
            EXPECT_EQ(ids.front(), recruiting.getId());
        }

        {
            const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}.setStatus(ListingStatus::Locked).setScheduledAfter(getNow())) };
            ASSERT_EQ(ids.size(), 1);
            EXPECT_EQ(ids.front(), locked.getId());
        }

        {
            const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}) };
            EXPECT_EQ(ids.size(), 3);
        }
    }

    TEST_F(DatabaseFixture, Listing_candidatesFilters)
    {
        ScopedUser host{ session, "MyHost" };

        ScopedListing food{ session, host.lockAndGet(), "Food" };
        setupListing(session, food, ListingSetup{ .category = ListingCategory::FoodAndSnacks, .market = Market::Costco });

        ScopedListing household{ session, host.lockAndGet(), "Household" };
        setupListing(session, household, ListingSetup{ .category = ListingCategory::Household, .market = Market::EMart });

        {
            const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}.setCategory(ListingCategory::FoodAndSnacks)) };
            ASSERT_EQ(ids.size(), 1);
            EXPECT_EQ(ids.front(), food.getId());
        }

        {
            const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}.setMarket(Market::EMart)) };
            ASSERT_EQ(ids.size(), 1);
            EXPECT_EQ(ids.front(), household.getId());
        }

        {
            const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}.setCategory(ListingCategory::FoodAndSnacks).setMarket(Market::EMart)) };
            EXPECT_TRUE(ids.empty());
        }
    }

    TEST_F(DatabaseFixture, Listing_candidatesBoundingBox)
    {
        ScopedUser host{ session, "MyHost" };

        ScopedListing seoul{ session, host.lockAndGet(), "Seoul" };
        setupListing(session, seoul, ListingSetup{ .latitude = 37.5665, .longitude = 126.9780 });

        ScopedListing busan{ session, host.lockAndGet(), "Busan" };
        setupListing(session, busan, ListingSetup{ .latitude = 35.1796, .longitude = 129.0756 });

        const GeoBoundingBox aroundSeoul{ .minLatitude = 37.0, .maxLatitude = 38.0, .minLongitude = 126.5, .maxLongitude = 127.5 };
        const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}.setBoundingBox(aroundSeoul)) };
        ASSERT_EQ(ids.size(), 1);
        EXPECT_EQ(ids.front(), seoul.getId());
    }

    TEST_F(DatabaseFixture, Listing_candidatesOrder)
    {
        ScopedUser host{ session, "MyHost" };

        ScopedListing oldest{ session, host.lockAndGet(), "Oldest" };
        setupListing(session, oldest, ListingSetup{ .createdDateTime = getNow().addDays(-3) });

        ScopedListing newest{ session, host.lockAndGet(), "Newest" };
        setupListing(session, newest, ListingSetup{ .createdDateTime = getNow().addDays(-1) });

        ScopedListing sameAsNewest{ session, host.lockAndGet(), "SameAsNewest" };
        setupListing(session, sameAsNewest, ListingSetup{ .createdDateTime = getNow().addDays(-1) });

        {
            const auto ids{ findCandidateIds(session, Listing::CandidateFindParameters{}) };
            const std::vector<ListingId> expected{ sameAsNewest.getId(), newest.getId(), oldest.getId() };
            EXPECT_EQ(ids, expected);
        }

        {
            std::vector<ListingId> ids;

            auto transaction{ session.createReadTransaction() };
            Listing::findCandidates(session, Listing::CandidateFindParameters{}, [&](const Listing::CandidateEntry& entry) {
                ids.push_back(entry.id);
                return ids.size() < 2;
            });

            const std::vector<ListingId> expected{ sameAsNewest.getId(), newest.getId() };
            EXPECT_EQ(ids, expected);
        }
    }

    TEST_F(DatabaseFixture, Listing_candidatesHostStars)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser otherHost{ session, "MyOtherHost" };
        ScopedUser reviewer{ session, "MyReviewer" };

        ScopedListing listing{ session, host.lockAndGet(), "Listing" };
        setupListing(session, listing, ListingSetup{ .category = ListingCategory::BeautyAndHealthcare, .market = Market::Homeplus });

        ScopedListing otherListing{ session, otherHost.lockAndGet(), "OtherListing" };
        setupListing(session, otherListing, ListingSetup{ .createdDateTime = getNow().addDays(-2) });

        ScopedRating rating1{ session, listing.lockAndGet(), reviewer.lockAndGet(), host.lockAndGet(), 5 };
        ScopedRating rating2{ session, listing.lockAndGet(), reviewer.lockAndGet(), host.lockAndGet(), 4 };

        std::vector<Listing::CandidateEntry> entries;
        {
            auto transaction{ session.createReadTransaction() };
            Listing::findCandidates(session, Listing::CandidateFindParameters{}, [&](const Listing::CandidateEntry& entry) {
                entries.push_back(entry);
                return true;
            });
        }

        ASSERT_EQ(entries.size(), 2);

        EXPECT_EQ(entries[0].id, listing.getId());
        EXPECT_EQ(entries[0].host, host.getId());
        EXPECT_EQ(entries[0].category, ListingCategory::BeautyAndHealthcare);
        EXPECT_EQ(entries[0].market, Market::Homeplus);
        EXPECT_DOUBLE_EQ(entries[0].latitude, 37.5665);
        EXPECT_DOUBLE_EQ(entries[0].longitude, 126.9780);
        EXPECT_EQ(entries[0].scheduledDateTime, getNow().addDays(2));
        EXPECT_DOUBLE_EQ(entries[0].hostAverageStars, 4.5);

        EXPECT_EQ(entries[1].id, otherListing.getId());
        EXPECT_DOUBLE_EQ(entries[1].hostAverageStars, Rating::defaultAverageStars);
    }
} // namespace grouprank::db::tests
