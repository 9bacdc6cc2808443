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
#include <string_view>

namespace grouprank::core
{
    // Read-only access to the settings of a configuration file
    // Getters return the given default value if the setting is absent,
    // and throw GroupRankException if the setting is present with an unexpected type
    class IConfig
    {
    public:
        virtual ~IConfig() = default;

        virtual std::string_view getString(std::string_view setting, std::string_view def) = 0;
        virtual std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) = 0;
        virtual unsigned long getULong(std::string_view setting, unsigned long def) = 0;
        virtual double getDouble(std::string_view setting, double def) = 0;
        virtual bool getBool(std::string_view setting, bool def) = 0;
    };

    // throws GroupRankException if the file cannot be read or parsed
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p);
} // namespace grouprank::core
