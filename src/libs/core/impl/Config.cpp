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

#include "Config.hpp"

#include <string>

#include "core/Exception.hpp"

namespace grouprank::core
{
    namespace
    {
        template<typename T>
        T getValue(const libconfig::Setting& setting)
        {
            try
            {
                return setting;
            }
            catch (const libconfig::SettingTypeException&)
            {
                throw GroupRankException{ "Bad type for setting '" + std::string{ setting.getPath() } + "'" };
            }
        }
    } // namespace

    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        // "ranking-w1-min = 1;" must be readable as a double
        _config.setAutoConvert(true);

        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw GroupRankException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw GroupRankException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
    }

    const libconfig::Setting* Config::lookup(std::string_view setting) const
    {
        const std::string path{ setting };
        if (!_config.exists(path))
            return nullptr;

        return &_config.lookup(path);
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value)
            return def;

        return getValue<const char*>(*value);
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value)
            return def;

        return std::filesystem::path{ getValue<const char*>(*value) };
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value)
            return def;

        const long long res{ getValue<long long>(*value) };
        if (res < 0)
            throw GroupRankException{ "Bad value for setting '" + std::string{ setting } + "': must be positive" };

        return static_cast<unsigned long>(res);
    }

    double Config::getDouble(std::string_view setting, double def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value)
            return def;

        return getValue<double>(*value);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        const libconfig::Setting* value{ lookup(setting) };
        if (!value)
            return def;

        return getValue<bool>(*value);
    }
} // namespace grouprank::core
