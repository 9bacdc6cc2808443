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

#include <memory>

#include "services/ranking/Types.hpp"

namespace grouprank::core::logging
{
    class ILogger;
}

namespace grouprank::ranking
{
    class IRankingDataSource;
    struct RankingSettings;

    class IRankingService
    {
    public:
        virtual ~IRankingService() = default;

        // Never writes anything, may be called concurrently
        virtual RankingResult rank(const RankingRequest& request) const = 0;
    };

    std::unique_ptr<IRankingService> createRankingService(IRankingDataSource& dataSource, const RankingSettings& settings, core::logging::ILogger& logger);
} // namespace grouprank::ranking
