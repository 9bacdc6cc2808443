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
#include <functional>
#include <optional>
#include <vector>

#include <Wt/WDateTime.h>

#include "database/Types.hpp"
#include "database/objects/ListingId.hpp"
#include "database/objects/UserId.hpp"

namespace grouprank::db
{
    class Session;

    // Read-only view over the signals users leave on listings:
    // favorites (weak), applied participations (medium), accepted or fulfilled participations (strong)
    class Interaction
    {
    public:
        struct Entry
        {
            ListingId listing;
            InteractionSignal signal;
            Wt::WDateTime dateTime; // decision date for decided participations, application date otherwise
        };

        struct FindParameters
        {
            UserId user;
            InteractionSignalSet signals{ InteractionSignal::Strong, InteractionSignal::Medium, InteractionSignal::Weak };
            std::optional<std::size_t> limit;

            FindParameters& setUser(UserId _user)
            {
                user = _user;
                return *this;
            }
            FindParameters& setSignals(InteractionSignalSet _signals)
            {
                signals = _signals;
                return *this;
            }
            FindParameters& setLimit(std::optional<std::size_t> _limit)
            {
                limit = _limit;
                return *this;
            }
        };

        // most recent first
        static std::vector<Entry> findRecent(Session& session, const FindParameters& params);

        // distinct listings, ordered by their most recent interaction
        static std::vector<ListingId> findRecentListings(Session& session, const FindParameters& params);

        // Weights of all users summed per (user, listing), visited in (user, listing) order
        // Stops after pairCountLimit pairs, if set
        using AggregatedWeightVisitor = std::function<void(UserId user, ListingId listing, double weight)>;
        static void visitAggregatedWeights(Session& session, std::optional<std::size_t> pairCountLimit, AggregatedWeightVisitor visitor);

    private:
        Interaction() = delete;
    };
} // namespace grouprank::db
