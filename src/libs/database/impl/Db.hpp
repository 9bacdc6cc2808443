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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include <Wt/Dbo/SqlConnectionPool.h>

#include "database/IDb.hpp"

namespace grouprank::db
{
    // SQLite database shared by all the sessions of the process
    class Db : public IDb
    {
    public:
        Db(const std::filesystem::path& dbPath, const DbSettings& settings, core::logging::ILogger& logger);
        ~Db() override;

    private:
        Db(const Db&) = delete;
        Db& operator=(const Db&) = delete;

        friend class Session;

        Session& getTLSSession() override;

        std::shared_mutex& getMutex() { return _writeMutex; }
        Wt::Dbo::SqlConnectionPool& getConnectionPool() { return *_connectionPool; }
        core::logging::ILogger& getLogger() { return _logger; }

        // borrows a connection from the pool for the duration of the call
        void withConnection(const std::function<void(Wt::Dbo::SqlConnection&)>& func);
        void checkIntegrity();

        const std::uint64_t _instanceId;
        core::logging::ILogger& _logger;
        std::shared_mutex _writeMutex;
        std::unique_ptr<Wt::Dbo::SqlConnectionPool> _connectionPool;

        std::mutex _sessionsMutex;
        std::vector<std::unique_ptr<Session>> _sessions;
    };
} // namespace grouprank::db
