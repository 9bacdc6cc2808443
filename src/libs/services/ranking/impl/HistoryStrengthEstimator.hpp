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

#include <Wt/WDateTime.h>

#include "services/ranking/Types.hpp"

namespace grouprank::ranking
{
    // s = clip(sum(weight * exp(-age_days / decayDays)) / reference, 0, 1)
    // Events dated after now have a zero age
    class HistoryStrengthEstimator
    {
    public:
        HistoryStrengthEstimator(double decayDays, double reference);

        double estimate(std::span<const InteractionRecord> interactions, const Wt::WDateTime& now) const;

    private:
        const double _decayDays;
        const double _reference;
    };
} // namespace grouprank::ranking
