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

#include "services/similarity/SimilarityBuilderSettings.hpp"

#include <string>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace grouprank::similarity
{
    void SimilarityBuilderSettings::validate() const
    {
        if (topK == 0)
            throw core::GroupRankException{ "Invalid value for 'similarity-top-k': must be strictly positive" };
        if (minCommon == 0)
            throw core::GroupRankException{ "Invalid value for 'similarity-min-common': must be strictly positive" };
        if (minSimilarity < 0 || minSimilarity > 1)
            throw core::GroupRankException{ "Invalid value for 'similarity-min-sim': " + std::to_string(minSimilarity) + " (expected value in [0, 1])" };
        if (lambda < 0)
            throw core::GroupRankException{ "Invalid value for 'similarity-lambda': " + std::to_string(lambda) + " (expected positive value)" };
    }

    SimilarityBuilderSettings readSimilarityBuilderSettings(core::IConfig& config)
    {
        const SimilarityBuilderSettings defaultSettings;

        SimilarityBuilderSettings settings;
        settings.topK = config.getULong("similarity-top-k", defaultSettings.topK);
        settings.minCommon = config.getULong("similarity-min-common", defaultSettings.minCommon);
        settings.minSimilarity = config.getDouble("similarity-min-sim", defaultSettings.minSimilarity);
        settings.lambda = config.getDouble("similarity-lambda", defaultSettings.lambda);
        settings.interactionLimit = config.getULong("similarity-interaction-limit", defaultSettings.interactionLimit);

        settings.validate();

        return settings;
    }
} // namespace grouprank::similarity
