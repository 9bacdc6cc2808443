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

#include <span>
#include <vector>

#include "database/objects/ItemItemSimilarity.hpp"
#include "services/similarity/ISimilarityBuilderService.hpp"
#include "services/similarity/SimilarityBuilderSettings.hpp"

#include "SimilarityComputer.hpp"

namespace grouprank::similarity
{
    class SimilarityBuilderService : public ISimilarityBuilderService
    {
    public:
        SimilarityBuilderService(db::IDb& db, const SimilarityBuilderSettings& settings, core::logging::ILogger& logger);
        ~SimilarityBuilderService() override = default;
        SimilarityBuilderService(const SimilarityBuilderService&) = delete;
        SimilarityBuilderService& operator=(const SimilarityBuilderService&) = delete;

    private:
        SimilarityBuildReport run() override;

        std::vector<WeightedInteraction> loadInteractions();
        void storeSimilarities(std::span<const db::ItemItemSimilarity::Entry> entries);

        db::IDb& _db;
        const SimilarityBuilderSettings _settings;
        core::logging::ILogger& _logger;
    };
} // namespace grouprank::similarity
