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

#include "core/ILogger.hpp"
#include "database/objects/ItemItemSimilarity.hpp"
#include "services/similarity/ISimilarityBuilderService.hpp"
#include "services/similarity/SimilarityBuilderSettings.hpp"

#include "Common.hpp"

namespace grouprank::similarity::tests
{
    using db::tests::ScopedFavorite;
    using db::tests::ScopedListing;
    using db::tests::ScopedParticipation;
    using db::tests::ScopedUser;

    namespace
    {
        // the cache is not tied to listings, clear it so that the fixture finds an empty database
        class ScopedCacheCleaner
        {
        public:
            ScopedCacheCleaner(db::Session& session)
                : _session{ session } {}

            ~ScopedCacheCleaner()
            {
                auto transaction{ _session.createWriteTransaction() };
                db::ItemItemSimilarity::clear(_session);
            }

        private:
            ScopedCacheCleaner(const ScopedCacheCleaner&) = delete;
            ScopedCacheCleaner& operator=(const ScopedCacheCleaner&) = delete;

            db::Session& _session;
        };

        std::vector<db::ItemItemSimilarity::Entry> getAllEntries(db::Session& session, std::span<const db::ListingId> sources)
        {
            std::vector<db::ItemItemSimilarity::Entry> res;

            auto transaction{ session.createReadTransaction() };
            for (db::ListingId source : sources)
            {
                const auto neighbors{ db::ItemItemSimilarity::findNeighbors(session, source) };
                res.insert(std::end(res), std::cbegin(neighbors.results), std::cend(neighbors.results));
            }

            return res;
        }
    } // namespace

    class SimilarityBuilderServiceTest : public db::tests::DatabaseFixture
    {
    public:
        std::unique_ptr<core::logging::ILogger> logger{ core::logging::createLogger(core::logging::Severity::ERROR) };
        SimilarityBuilderSettings settings;
        ScopedCacheCleaner cacheCleaner{ session };

        std::unique_ptr<ISimilarityBuilderService> createService() { return createSimilarityBuilderService(session.getDb(), settings, *logger); }
    };

    TEST_F(SimilarityBuilderServiceTest, empty)
    {
        const SimilarityBuildReport report{ createService()->run() };
        EXPECT_EQ(report.interactionCount, 0);
        EXPECT_EQ(report.userCount, 0);
        EXPECT_EQ(report.itemCount, 0);
        EXPECT_EQ(report.storedPairCount, 0);

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(db::ItemItemSimilarity::getCount(session), 0);
    }

    TEST_F(SimilarityBuilderServiceTest, singleCommonUser)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser user{ session, "MyUser" };

        ScopedListing listing1{ session, host.lockAndGet(), "MyListing1" };
        ScopedListing listing2{ session, host.lockAndGet(), "MyListing2" };

        ScopedFavorite favorite1{ session, user.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite2{ session, user.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };

        const SimilarityBuildReport report{ createService()->run() };
        EXPECT_EQ(report.interactionCount, 2);
        EXPECT_EQ(report.userCount, 1);
        EXPECT_EQ(report.itemCount, 2);
        EXPECT_EQ(report.storedPairCount, 0);

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(db::ItemItemSimilarity::getCount(session), 0);
    }

    TEST_F(SimilarityBuilderServiceTest, interactionLimit)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser user1{ session, "MyUser1" };
        ScopedUser user2{ session, "MyUser2" };

        ScopedListing listing1{ session, host.lockAndGet(), "MyListing1" };
        ScopedListing listing2{ session, host.lockAndGet(), "MyListing2" };

        ScopedFavorite favorite11{ session, user1.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite12{ session, user1.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite21{ session, user2.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite22{ session, user2.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };

        // pairs are loaded in (user, listing) order: only user1 is seen
        settings.interactionLimit = 2;
        {
            const SimilarityBuildReport report{ createService()->run() };
            EXPECT_EQ(report.interactionCount, 2);
            EXPECT_EQ(report.userCount, 1);
            EXPECT_EQ(report.itemCount, 2);
            EXPECT_EQ(report.storedPairCount, 0);
        }

        settings.interactionLimit = 0;
        {
            const SimilarityBuildReport report{ createService()->run() };
            EXPECT_EQ(report.interactionCount, 4);
            EXPECT_EQ(report.userCount, 2);
            EXPECT_EQ(report.storedPairCount, 2);
        }
    }

    TEST_F(SimilarityBuilderServiceTest, build)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser user1{ session, "MyUser1" };
        ScopedUser user2{ session, "MyUser2" };

        ScopedListing listing1{ session, host.lockAndGet(), "MyListing1" };
        ScopedListing listing2{ session, host.lockAndGet(), "MyListing2" };

        // user1: favorite (1.0) + applied (0.5) on listing1, favorite on listing2
        ScopedFavorite favorite11{ session, user1.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedParticipation participation11{ session, user1.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite12{ session, user1.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };
        // user2: favorite on both
        ScopedFavorite favorite21{ session, user2.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite22{ session, user2.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };

        settings.lambda = 0;
        const SimilarityBuildReport report{ createService()->run() };
        EXPECT_EQ(report.interactionCount, 4);
        EXPECT_EQ(report.userCount, 2);
        EXPECT_EQ(report.itemCount, 2);
        EXPECT_EQ(report.storedPairCount, 2);

        // listing1 = (1.5, 1.0), listing2 = (1.0, 1.0)
        const double expected{ 2.5 / (std::sqrt(3.25) * std::sqrt(2.0)) };

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(db::ItemItemSimilarity::getCount(session), 2);

        const db::ItemItemSimilarity::pointer forward{ db::ItemItemSimilarity::find(session, listing1.getId(), listing2.getId()) };
        ASSERT_TRUE(forward);
        EXPECT_NEAR(forward->getSimilarity(), expected, 1e-9);
        EXPECT_EQ(forward->getCommonUserCount(), 2);
        EXPECT_TRUE(forward->getUpdatedAt().isValid());

        const db::ItemItemSimilarity::pointer backward{ db::ItemItemSimilarity::find(session, listing2.getId(), listing1.getId()) };
        ASSERT_TRUE(backward);
        EXPECT_DOUBLE_EQ(backward->getSimilarity(), forward->getSimilarity());
    }

    TEST_F(SimilarityBuilderServiceTest, idempotent)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser user1{ session, "MyUser1" };
        ScopedUser user2{ session, "MyUser2" };
        ScopedUser user3{ session, "MyUser3" };

        ScopedListing listing1{ session, host.lockAndGet(), "MyListing1" };
        ScopedListing listing2{ session, host.lockAndGet(), "MyListing2" };
        ScopedListing listing3{ session, host.lockAndGet(), "MyListing3" };

        ScopedFavorite favorite11{ session, user1.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite12{ session, user1.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite13{ session, user1.lockAndGet(), listing3.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite21{ session, user2.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite22{ session, user2.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };
        ScopedParticipation participation23{ session, user2.lockAndGet(), listing3.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite31{ session, user3.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedParticipation participation33{ session, user3.lockAndGet(), listing3.lockAndGet(), db::tests::getNow() };

        const std::vector<db::ListingId> listings{ listing1.getId(), listing2.getId(), listing3.getId() };

        const SimilarityBuildReport firstReport{ createService()->run() };
        const std::vector<db::ItemItemSimilarity::Entry> firstEntries{ getAllEntries(session, listings) };
        ASSERT_FALSE(firstEntries.empty());
        EXPECT_EQ(firstEntries.size(), firstReport.storedPairCount);

        const SimilarityBuildReport secondReport{ createService()->run() };
        const std::vector<db::ItemItemSimilarity::Entry> secondEntries{ getAllEntries(session, listings) };
        EXPECT_EQ(secondReport.storedPairCount, firstReport.storedPairCount);
        EXPECT_EQ(secondEntries, firstEntries);
    }

    TEST_F(SimilarityBuilderServiceTest, failureKeepsPreviousCache)
    {
        ScopedUser host{ session, "MyHost" };
        ScopedUser user1{ session, "MyUser1" };
        ScopedUser user2{ session, "MyUser2" };

        ScopedListing listing1{ session, host.lockAndGet(), "MyListing1" };
        ScopedListing listing2{ session, host.lockAndGet(), "MyListing2" };
        ScopedListing listing3{ session, host.lockAndGet(), "MyListing3" };

        ScopedFavorite favorite11{ session, user1.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite12{ session, user1.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite21{ session, user2.lockAndGet(), listing1.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite22{ session, user2.lockAndGet(), listing2.lockAndGet(), db::tests::getNow() };

        const std::vector<db::ListingId> listings{ listing1.getId(), listing2.getId(), listing3.getId() };

        createService()->run();
        const std::vector<db::ItemItemSimilarity::Entry> previousEntries{ getAllEntries(session, listings) };
        ASSERT_EQ(previousEntries.size(), 2);

        // new data that would change the cache
        ScopedFavorite favorite13{ session, user1.lockAndGet(), listing3.lockAndGet(), db::tests::getNow() };
        ScopedFavorite favorite23{ session, user2.lockAndGet(), listing3.lockAndGet(), db::tests::getNow() };

        {
            auto transaction{ session.createWriteTransaction() };
            session.execute("CREATE TRIGGER fail_similarity_insert BEFORE INSERT ON item_item_similarity WHEN NEW.source_id = " + listing3.getId().toString() + " BEGIN SELECT RAISE(ABORT, 'insert failure'); END");
        }

        EXPECT_ANY_THROW(createService()->run());

        {
            auto transaction{ session.createWriteTransaction() };
            session.execute("DROP TRIGGER fail_similarity_insert");
        }

        EXPECT_EQ(getAllEntries(session, listings), previousEntries);

        // back to normal
        const SimilarityBuildReport report{ createService()->run() };
        EXPECT_EQ(report.storedPairCount, 6);
        EXPECT_EQ(getAllEntries(session, listings).size(), 6);
    }
} // namespace grouprank::similarity::tests
