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
#include "Db.hpp"

#include <atomic>
#include <chrono>
#include <unordered_map>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/ILogger.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"

namespace grouprank::db
{
    namespace
    {
        // Sqlite3 backend that applies our pragmas to every connection of the pool
        class Connection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            Connection(const std::filesystem::path& dbPath, core::logging::ILogger& logger)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
                , _logger{ logger }
            {
                applyPragmas();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
                , _logger{ other._logger }
            {
                applyPragmas();
            }

        private:
            Connection& operator=(const Connection&) = delete;

            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void applyPragmas()
            {
                for (const char* pragma : { "PRAGMA journal_mode=WAL", "PRAGMA synchronous=normal", "PRAGMA foreign_keys=ON", "PRAGMA temp_store=MEMORY", "PRAGMA cache_size=-8000" })
                {
                    GROUPRANK_LOG(_logger, DB, DEBUG, "Applying '" << pragma << "'");
                    executeSql(pragma);
                }
            }

            core::logging::ILogger& _logger;
        };

        std::atomic<std::uint64_t> nextInstanceId{};
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, const DbSettings& settings, core::logging::ILogger& logger)
    {
        return std::make_unique<Db>(dbPath, settings, logger);
    }

    Db::Db(const std::filesystem::path& dbPath, const DbSettings& settings, core::logging::ILogger& logger)
        : _instanceId{ nextInstanceId++ }
        , _logger{ logger }
    {
        if (settings.connectionCount == 0)
            throw Exception{ "At least one database connection is required" };

        GROUPRANK_LOG(_logger, DB, INFO, "Opening database " << dbPath << " using " << settings.connectionCount << " connection(s)");

        auto connection{ std::make_unique<Connection>(dbPath, _logger) };
        connection->setProperty("show-queries", settings.showQueries ? "true" : "false");

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), static_cast<int>(settings.connectionCount)) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });
        _connectionPool = std::move(connectionPool);

        checkIntegrity();
    }

    Db::~Db() = default;

    Session& Db::getTLSSession()
    {
        // keyed by instance, several databases may be opened during the process lifetime
        static thread_local std::unordered_map<std::uint64_t, Session*> sessionByInstance;

        Session*& session{ sessionByInstance[_instanceId] };
        if (!session)
        {
            auto newSession{ std::make_unique<Session>(*this) };
            session = newSession.get();

            std::scoped_lock lock{ _sessionsMutex };
            _sessions.push_back(std::move(newSession));
        }

        return *session;
    }

    void Db::withConnection(const std::function<void(Wt::Dbo::SqlConnection&)>& func)
    {
        // hands the connection back to the pool even if func throws
        struct PooledConnection
        {
            Wt::Dbo::SqlConnectionPool& pool;
            std::unique_ptr<Wt::Dbo::SqlConnection> connection{ pool.getConnection() };

            ~PooledConnection() { pool.returnConnection(std::move(connection)); }
        };

        PooledConnection pooled{ *_connectionPool };
        func(*pooled.connection);
    }

    void Db::checkIntegrity()
    {
        GROUPRANK_LOG(_logger, DB, INFO, "Checking database integrity...");

        std::size_t errorCount{};
        bool passed{};
        withConnection([&](Wt::Dbo::SqlConnection& connection) {
            auto statement{ connection.prepareStatement("PRAGMA quick_check") };
            statement->execute();

            std::string row;
            while (!passed && statement->nextRow())
            {
                row.clear();
                if (!statement->getResult(0, &row, 256))
                    continue;

                if (row == "ok")
                    passed = true;
                else
                {
                    GROUPRANK_LOG(_logger, DB, ERROR, "Integrity check: " << row);
                    errorCount++;
                }
            }
        });

        if (!passed)
            throw Exception{ "Database integrity check failed (" + std::to_string(errorCount) + " error(s)), restore it from a backup or recreate it" };

        GROUPRANK_LOG(_logger, DB, INFO, "Database integrity check passed");
    }
} // namespace grouprank::db
