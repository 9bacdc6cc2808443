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

#include "database/Session.hpp"

#include <algorithm>
#include <vector>

#include <Wt/Dbo/WtSqlTraits.h>

#include "core/ILogger.hpp"
#include "database/objects/Favorite.hpp"
#include "database/objects/ItemItemSimilarity.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/Participation.hpp"
#include "database/objects/Rating.hpp"
#include "database/objects/User.hpp"

#include "Db.hpp"
#include "TransactionChecker.hpp"
#include "Utils.hpp"
#include "traits/EnumSetTraits.hpp"
#include "traits/HourMaskTraits.hpp"
#include "traits/IdTypeTraits.hpp"

namespace grouprank::db
{
    Session::Session(IDb& db)
        : _db{ db }
        , _logger{ static_cast<Db&>(db).getLogger() }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Favorite>("favorite");
        _session.mapClass<ItemItemSimilarity>("item_item_similarity");
        _session.mapClass<Listing>("listing");
        _session.mapClass<Participation>("participation");
        _session.mapClass<Rating>("rating");
        _session.mapClass<User>("user");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::checkWriteTransaction() const
    {
#if GROUPRANK_CHECK_TRANSACTION_ACCESSES
        transactionChecker::requireAccess(transactionChecker::AccessType::Write, _session);
#endif
    }

    void Session::checkReadTransaction() const
    {
#if GROUPRANK_CHECK_TRANSACTION_ACCESSES
        transactionChecker::requireAccess(transactionChecker::AccessType::Read, _session);
#endif
    }

    void Session::execute(std::string_view statement)
    {
        utils::executeCommand(_session, std::string{ statement });
    }

    void Session::prepareTablesIfNeeded()
    {
        GROUPRANK_LOG(_logger, DB, INFO, "Preparing tables...");

        // Initial creation case
        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            GROUPRANK_LOG(_logger, DB, INFO, "Tables created");
        }
        catch (Wt::Dbo::Exception& e)
        {
            GROUPRANK_LOG(_logger, DB, DEBUG, "Cannot create tables: " << e.what());
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                GROUPRANK_LOG(_logger, DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
        }
    }

    void Session::createIndexesIfNeeded()
    {
        GROUPRANK_LOG(_logger, DB, INFO, "Creating indexes... This may take a while...");

        {
            auto transaction{ createWriteTransaction() };

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS favorite_user_created_idx ON favorite(user_id, created_date_time)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS favorite_listing_idx ON favorite(listing_id)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS favorite_user_listing_idx ON favorite(user_id, listing_id)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS item_item_similarity_source_neighbor_idx ON item_item_similarity(source_id, neighbor_id)");

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS listing_status_scheduled_idx ON listing(status, scheduled_date_time)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS listing_created_idx ON listing(created_date_time)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS listing_host_idx ON listing(host_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS listing_latitude_longitude_idx ON listing(latitude, longitude)");

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS participation_user_status_idx ON participation(user_id, status)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS participation_listing_idx ON participation(listing_id)");

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS rating_reviewee_idx ON rating(reviewee_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS rating_listing_idx ON rating(listing_id)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS user_login_name_idx ON user(login_name)");
        }

        GROUPRANK_LOG(_logger, DB, INFO, "Indexes created!");
    }

    void Session::analyze()
    {
        GROUPRANK_LOG(_logger, DB, DEBUG, "Performing database analyze...");

        {
            auto transaction{ createWriteTransaction() };
            utils::executeCommand(_session, "ANALYZE");
        }

        GROUPRANK_LOG(_logger, DB, DEBUG, "Analyze complete!");
    }

    bool Session::areAllTablesEmpty()
    {
        checkReadTransaction();

        const std::vector<std::string> entryList{ utils::fetchQueryResults<std::string>(_session.query<std::string>("SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%'")) };

        return std::all_of(entryList.cbegin(), entryList.cend(), [this](const std::string& entry) {
            const auto count{ utils::fetchQuerySingleResult(_session.query<long>("SELECT COUNT(*) FROM \"" + entry + "\"")) };
            return count == 0;
        });
    }
} // namespace grouprank::db
