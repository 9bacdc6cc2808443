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

#include <atomic>
#include <string>
#include <unistd.h>

#include "database/objects/ItemItemSimilarity.hpp"

namespace grouprank::db::tests
{
    namespace
    {
        std::filesystem::path makeTmpDbPath()
        {
            static std::atomic<unsigned> counter{};
            return std::filesystem::temp_directory_path() / ("grouprank-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".db");
        }
    } // namespace

    TmpDatabase::TmpDatabase()
        : _dbPath{ makeTmpDbPath() }
        , _logger{ core::logging::createLogger(core::logging::Severity::WARNING) }
        , _db{ createDb(_dbPath, DbSettings{}, *_logger) }
    {
    }

    TmpDatabase::~TmpDatabase()
    {
        _db.reset();

        std::error_code ec;
        for (const char* suffix : { "", "-wal", "-shm" })
            std::filesystem::remove(_dbPath.string() + suffix, ec);
    }

    void DatabaseFixture::SetUpTestSuite()
    {
        _tmpDb = std::make_unique<TmpDatabase>();

        db::Session setupSession{ _tmpDb->getDb() };
        setupSession.prepareTablesIfNeeded();
        setupSession.createIndexesIfNeeded();
    }

    void DatabaseFixture::TearDownTestSuite()
    {
        _tmpDb.reset();
    }

    // runs after the members of derived fixtures are destroyed
    DatabaseFixture::~DatabaseFixture()
    {
        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(Favorite::getCount(session), 0);
        EXPECT_EQ(ItemItemSimilarity::getCount(session), 0);
        EXPECT_EQ(Listing::getCount(session), 0);
        EXPECT_EQ(Participation::getCount(session), 0);
        EXPECT_EQ(Rating::getCount(session), 0);
        EXPECT_EQ(User::getCount(session), 0);
    }

    Wt::WDateTime getNow()
    {
        return Wt::WDateTime{ Wt::WDate{ 2025, 6, 1 }, Wt::WTime{ 12, 0 } };
    }
} // namespace grouprank::db::tests
