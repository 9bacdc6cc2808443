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

#include <array>
#include <cstddef>

#include "database/Types.hpp"
#include "services/ranking/Types.hpp"

namespace grouprank::ranking::features
{
    // [categories][markets][hours of the day]
    static constexpr std::size_t categoryOffset{ 0 };
    static constexpr std::size_t marketOffset{ categoryOffset + db::listingCategoryCount };
    static constexpr std::size_t hourOffset{ marketOffset + db::marketCount };
    static constexpr std::size_t featureVectorDimension{ hourOffset + db::hourCount };

    using FeatureVector = std::array<double, featureVectorDimension>;

    // multi-hot categories, markets and wished hours
    FeatureVector buildUserVector(const UserProfileFeatures& profile);

    // one-hot category, market and scheduled hour. Missing values give a zero segment
    FeatureVector buildCandidateVector(const CandidateListing& candidate);
} // namespace grouprank::ranking::features
