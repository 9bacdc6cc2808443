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

#include <cstddef>
#include <filesystem>
#include <memory>

namespace grouprank::core::logging
{
    class ILogger;
}

namespace grouprank::db
{
    class Session;

    class IDb
    {
    public:
        virtual ~IDb() = default;

        // Each thread gets its own session, created on first use
        virtual Session& getTLSSession() = 0;
    };

    struct DbSettings
    {
        std::size_t connectionCount{ 4 };
        bool showQueries{};
    };

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, const DbSettings& settings, core::logging::ILogger& logger);
} // namespace grouprank::db
