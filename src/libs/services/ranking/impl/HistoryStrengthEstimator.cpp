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

#include "HistoryStrengthEstimator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace grouprank::ranking
{
    namespace
    {
        double getAgeInDays(const Wt::WDateTime& dateTime, const Wt::WDateTime& now)
        {
            using Days = std::chrono::duration<double, std::ratio<86400>>;

            const Days age{ std::chrono::duration_cast<Days>(now.toTimePoint() - dateTime.toTimePoint()) };
            return std::max(0.0, age.count());
        }
    } // namespace

    HistoryStrengthEstimator::HistoryStrengthEstimator(double decayDays, double reference)
        : _decayDays{ decayDays }
        , _reference{ reference }
    {
    }

    double HistoryStrengthEstimator::estimate(std::span<const InteractionRecord> interactions, const Wt::WDateTime& now) const
    {
        double raw{};
        for (const InteractionRecord& interaction : interactions)
        {
            if (!interaction.dateTime.isValid())
                continue;

            raw += interaction.weight * std::exp(-getAgeInDays(interaction.dateTime, now) / _decayDays);
        }

        return std::clamp(raw / _reference, 0.0, 1.0);
    }
} // namespace grouprank::ranking
