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

#include <filesystem>
#include <memory>

#include <gtest/gtest.h>
#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"
#include "database/objects/Favorite.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/Participation.hpp"
#include "database/objects/Rating.hpp"
#include "database/objects/User.hpp"

namespace grouprank::db::tests
{
    // Object created on construction and removed on destruction, unless a cascade already did it
    template<typename T>
    class [[nodiscard]] ScopedObject
    {
    public:
        using IdType = typename T::IdType;

        template<typename... Args>
        ScopedObject(db::Session& session, Args&&... args)
            : _session{ session }
        {
            auto transaction{ _session.createWriteTransaction() };

            const typename T::pointer object{ _session.create<T>(std::forward<Args>(args)...) };
            EXPECT_TRUE(object);
            _id = object->getId();
        }

        ~ScopedObject()
        {
            auto transaction{ _session.createWriteTransaction() };

            if (typename T::pointer object{ T::find(_session, _id) })
                object.remove();
        }

        ScopedObject(const ScopedObject&) = delete;
        ScopedObject& operator=(const ScopedObject&) = delete;

        // opens its own read transaction
        typename T::pointer lockAndGet()
        {
            auto transaction{ _session.createReadTransaction() };
            return get();
        }

        // a transaction must already be active
        typename T::pointer get()
        {
            typename T::pointer object{ T::find(_session, _id) };
            EXPECT_TRUE(object);
            return object;
        }

        typename T::pointer operator->() { return get(); }

        IdType getId() const { return _id; }

    private:
        db::Session& _session;
        IdType _id;
    };

    using ScopedFavorite = ScopedObject<db::Favorite>;
    using ScopedListing = ScopedObject<db::Listing>;
    using ScopedParticipation = ScopedObject<db::Participation>;
    using ScopedRating = ScopedObject<db::Rating>;
    using ScopedUser = ScopedObject<db::User>;

    // Database file living in the temp directory, removed on destruction
    class TmpDatabase final
    {
    public:
        TmpDatabase();
        ~TmpDatabase();

        TmpDatabase(const TmpDatabase&) = delete;
        TmpDatabase& operator=(const TmpDatabase&) = delete;

        IDb& getDb() { return *_db; }

    private:
        const std::filesystem::path _dbPath;
        std::unique_ptr<core::logging::ILogger> _logger;
        std::unique_ptr<IDb> _db;
    };

    // One database per test suite, each test must leave it empty
    class DatabaseFixture : public ::testing::Test
    {
    public:
        ~DatabaseFixture() override;

        static void SetUpTestSuite();
        static void TearDownTestSuite();

    private:
        static inline std::unique_ptr<TmpDatabase> _tmpDb;

    public:
        db::Session session{ _tmpDb->getDb() };
    };

    // Fixed reference time used by the tests
    Wt::WDateTime getNow();
} // namespace grouprank::db::tests
