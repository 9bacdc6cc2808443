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

namespace grouprank::core
{
    class IConfig;
}

namespace grouprank::ranking
{
    struct RankingSettings
    {
        std::size_t candidateLimit{ 300 };
        std::size_t historyLimit{ 50 };     // listings used to compute collaborative scores
        std::size_t interactionLimit{ 200 }; // events used to compute the history strength
        double historyDecayDays{ 30.0 };
        double historyReference{ 10.0 };
        double w1Min{ 0.15 };
        double w1Max{ 0.50 };
        double coverageThreshold{ 0.30 };

        // throws GroupRankException if some values are out of bounds
        void validate() const;
    };

    // Missing keys are set to their default value, throws GroupRankException on invalid values
    RankingSettings readRankingSettings(core::IConfig& config);
} // namespace grouprank::ranking
