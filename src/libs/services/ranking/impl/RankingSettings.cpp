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

#include "services/ranking/RankingSettings.hpp"

#include <string>
#include <string_view>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace grouprank::ranking
{
    namespace
    {
        void checkRange(std::string_view name, double value, double min, double max)
        {
            if (value < min || value > max)
                throw core::GroupRankException{ "Invalid value for '" + std::string{ name } + "': " + std::to_string(value) + " (expected value in [" + std::to_string(min) + ", " + std::to_string(max) + "])" };
        }

        void checkPositive(std::string_view name, double value)
        {
            if (value <= 0)
                throw core::GroupRankException{ "Invalid value for '" + std::string{ name } + "': " + std::to_string(value) + " (expected strictly positive value)" };
        }
    } // namespace

    void RankingSettings::validate() const
    {
        checkPositive("ranking-candidate-limit", static_cast<double>(candidateLimit));
        checkPositive("ranking-history-decay-days", historyDecayDays);
        checkPositive("ranking-history-reference", historyReference);
        checkRange("ranking-w1-min", w1Min, 0, 1);
        checkRange("ranking-w1-max", w1Max, 0, 1);
        checkRange("ranking-coverage-threshold", coverageThreshold, 0, 1);

        if (w1Min > w1Max)
            throw core::GroupRankException{ "Invalid values for 'ranking-w1-min' and 'ranking-w1-max': min must not be greater than max" };
    }

    RankingSettings readRankingSettings(core::IConfig& config)
    {
        const RankingSettings defaultSettings;

        RankingSettings settings;
        settings.candidateLimit = config.getULong("ranking-candidate-limit", defaultSettings.candidateLimit);
        settings.historyLimit = config.getULong("ranking-history-limit", defaultSettings.historyLimit);
        settings.interactionLimit = config.getULong("ranking-interaction-limit", defaultSettings.interactionLimit);
        settings.historyDecayDays = config.getDouble("ranking-history-decay-days", defaultSettings.historyDecayDays);
        settings.historyReference = config.getDouble("ranking-history-reference", defaultSettings.historyReference);
        settings.w1Min = config.getDouble("ranking-w1-min", defaultSettings.w1Min);
        settings.w1Max = config.getDouble("ranking-w1-max", defaultSettings.w1Max);
        settings.coverageThreshold = config.getDouble("ranking-coverage-threshold", defaultSettings.coverageThreshold);

        settings.validate();

        return settings;
    }
} // namespace grouprank::ranking
