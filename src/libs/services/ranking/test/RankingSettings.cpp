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

#include <map>
#include <string>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/String.hpp"
#include "services/ranking/RankingSettings.hpp"

namespace grouprank::ranking::tests
{
    namespace
    {
        class MapConfig : public core::IConfig
        {
        public:
            std::map<std::string, std::string, std::less<>> values;

        private:
            std::string_view getString(std::string_view setting, std::string_view def) override
            {
                const auto it{ values.find(setting) };
                return it != std::cend(values) ? std::string_view{ it->second } : def;
            }

            std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override
            {
                const auto it{ values.find(setting) };
                return it != std::cend(values) ? std::filesystem::path{ it->second } : def;
            }

            unsigned long getULong(std::string_view setting, unsigned long def) override
            {
                return get<unsigned long>(setting, def);
            }

            double getDouble(std::string_view setting, double def) override
            {
                return get<double>(setting, def);
            }

            bool getBool(std::string_view setting, bool def) override
            {
                return get<bool>(setting, def);
            }

            template<typename T>
            T get(std::string_view setting, T def)
            {
                const auto it{ values.find(setting) };
                if (it == std::cend(values))
                    return def;

                return core::stringUtils::readAs<T>(it->second).value();
            }
        };
    } // namespace

    TEST(RankingSettings, defaults)
    {
        MapConfig config;
        const RankingSettings settings{ readRankingSettings(config) };

        EXPECT_EQ(settings.candidateLimit, 300);
        EXPECT_EQ(settings.historyLimit, 50);
        EXPECT_EQ(settings.interactionLimit, 200);
        EXPECT_DOUBLE_EQ(settings.historyDecayDays, 30.0);
        EXPECT_DOUBLE_EQ(settings.historyReference, 10.0);
        EXPECT_DOUBLE_EQ(settings.w1Min, 0.15);
        EXPECT_DOUBLE_EQ(settings.w1Max, 0.50);
        EXPECT_DOUBLE_EQ(settings.coverageThreshold, 0.30);
    }

    TEST(RankingSettings, values)
    {
        MapConfig config;
        config.values["ranking-candidate-limit"] = "100";
        config.values["ranking-history-limit"] = "20";
        config.values["ranking-w1-min"] = "0.1";
        config.values["ranking-w1-max"] = "0.9";
        config.values["ranking-history-decay-days"] = "7";

        const RankingSettings settings{ readRankingSettings(config) };
        EXPECT_EQ(settings.candidateLimit, 100);
        EXPECT_EQ(settings.historyLimit, 20);
        EXPECT_DOUBLE_EQ(settings.w1Min, 0.1);
        EXPECT_DOUBLE_EQ(settings.w1Max, 0.9);
        EXPECT_DOUBLE_EQ(settings.historyDecayDays, 7.0);
    }

    TEST(RankingSettings, invalidValues)
    {
        const std::map<std::string, std::string> invalidValues{
            { "ranking-candidate-limit", "0" },
            { "ranking-history-decay-days", "0" },
            { "ranking-history-reference", "-1" },
            { "ranking-w1-min", "-0.1" },
            { "ranking-w1-max", "1.5" },
            { "ranking-coverage-threshold", "2" },
        };

        for (const auto& [key, value] : invalidValues)
        {
            MapConfig config;
            config.values[key] = value;
            EXPECT_THROW(readRankingSettings(config), core::GroupRankException) << key << " = " << value;
        }
    }

    TEST(RankingSettings, w1MinGreaterThanMax)
    {
        MapConfig config;
        config.values["ranking-w1-min"] = "0.6";
        config.values["ranking-w1-max"] = "0.5";

        EXPECT_THROW(readRankingSettings(config), core::GroupRankException);
    }
} // namespace grouprank::ranking::tests
