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

#include <chrono>
#include <cstddef>
#include <memory>

namespace grouprank::core::logging
{
    class ILogger;
}

namespace grouprank::db
{
    class IDb;
}

namespace grouprank::similarity
{
    struct SimilarityBuilderSettings;

    struct SimilarityBuildReport
    {
        std::size_t interactionCount{}; // (user, listing) pairs
        std::size_t userCount{};
        std::size_t itemCount{};
        std::size_t storedPairCount{}; // directed rows written to the cache
        std::chrono::milliseconds elapsed{};
    };

    class ISimilarityBuilderService
    {
    public:
        virtual ~ISimilarityBuilderService() = default;

        // Recomputes the whole item-item similarity cache and replaces it in a single transaction
        // On error, the previous cache is left untouched and the exception is propagated
        virtual SimilarityBuildReport run() = 0;
    };

    std::unique_ptr<ISimilarityBuilderService> createSimilarityBuilderService(db::IDb& db, const SimilarityBuilderSettings& settings, core::logging::ILogger& logger);
} // namespace grouprank::similarity
