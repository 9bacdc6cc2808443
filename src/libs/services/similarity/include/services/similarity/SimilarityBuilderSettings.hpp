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

namespace grouprank::similarity
{
    struct SimilarityBuilderSettings
    {
        std::size_t topK{ 100 };        // max neighbors kept per listing
        std::size_t minCommon{ 2 };     // min users shared by two listings
        double minSimilarity{ 0.05 };   // after smoothing
        double lambda{ 5.0 };           // smoothing strength
        std::size_t interactionLimit{}; // max (user, listing) pairs loaded, 0 means no limit

        // throws GroupRankException if some values are out of bounds
        void validate() const;
    };

    // Missing keys are set to their default value, throws GroupRankException on invalid values
    SimilarityBuilderSettings readSimilarityBuilderSettings(core::IConfig& config);
} // namespace grouprank::similarity
