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

#include "database/objects/Interaction.hpp"

#include <string>
#include <tuple>
#include <vector>

#include <Wt/Dbo/WtSqlTraits.h>

#include "core/String.hpp"
#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

namespace grouprank::db
{
    namespace
    {
        std::string toSqlValue(ParticipationStatus status)
        {
            return std::to_string(static_cast<int>(status));
        }

        std::string toSqlValue(InteractionSignal signal)
        {
            return std::to_string(static_cast<int>(signal));
        }

        // Union of favorites and participations, exposing user_id, listing_id, signal and date_time columns
        // Each part is restricted to user_id = ? if filterOnUser is set
        std::string buildInteractionSubquery(InteractionSignalSet signals, bool filterOnUser)
        {
            std::vector<std::string> parts;

            if (signals.contains(InteractionSignal::Weak))
            {
                std::string part{ "SELECT f.user_id AS user_id, f.listing_id AS listing_id, " + toSqlValue(InteractionSignal::Weak) + " AS signal, f.created_date_time AS date_time FROM favorite f" };
                if (filterOnUser)
                    part += " WHERE f.user_id = ?";
                parts.push_back(std::move(part));
            }

            std::vector<std::string> statuses;
            if (signals.contains(InteractionSignal::Strong))
            {
                statuses.push_back(toSqlValue(ParticipationStatus::Accepted));
                statuses.push_back(toSqlValue(ParticipationStatus::Fulfilled));
            }
            if (signals.contains(InteractionSignal::Medium))
                statuses.push_back(toSqlValue(ParticipationStatus::Applied));

            if (!statuses.empty())
            {
                std::string part{ "SELECT p.user_id AS user_id, p.listing_id AS listing_id" };
                part += ", CASE WHEN p.status = " + toSqlValue(ParticipationStatus::Applied) + " THEN " + toSqlValue(InteractionSignal::Medium) + " ELSE " + toSqlValue(InteractionSignal::Strong) + " END AS signal";
                part += ", COALESCE(p.decided_date_time, p.applied_date_time) AS date_time";
                part += " FROM participation p WHERE p.status IN (" + core::stringUtils::joinStrings(statuses, ", ") + ")";
                if (filterOnUser)
                    part += " AND p.user_id = ?";
                parts.push_back(std::move(part));
            }

            return "(" + core::stringUtils::joinStrings(parts, " UNION ALL ") + ")";
        }
    } // namespace

    std::vector<Interaction::Entry> Interaction::findRecent(Session& session, const FindParameters& params)
    {
        session.checkReadTransaction();

        std::vector<Entry> res;
        if (params.signals.empty() || (params.limit && *params.limit == 0))
            return res;

        using ResultType = std::tuple<ListingId, int, Wt::WDateTime>;
        auto query{ session.getDboSession()->query<ResultType>("SELECT i.listing_id, i.signal, i.date_time FROM " + buildInteractionSubquery(params.signals, true) + " i") };

        // one bind per part of the union
        const bool hasFavoritePart{ params.signals.contains(InteractionSignal::Weak) };
        const bool hasParticipationPart{ params.signals.contains(InteractionSignal::Strong) || params.signals.contains(InteractionSignal::Medium) };
        if (hasFavoritePart)
            query.bind(params.user);
        if (hasParticipationPart)
            query.bind(params.user);

        query.orderBy("i.date_time DESC, i.listing_id DESC");
        if (params.limit)
            query.limit(static_cast<int>(*params.limit));

        utils::forEachQueryResult(query, [&](const ResultType& row) {
            res.push_back(Entry{ std::get<0>(row), static_cast<InteractionSignal>(std::get<1>(row)), std::get<2>(row) });
        });

        return res;
    }

    std::vector<ListingId> Interaction::findRecentListings(Session& session, const FindParameters& params)
    {
        session.checkReadTransaction();

        if (params.signals.empty() || (params.limit && *params.limit == 0))
            return {};

        auto query{ session.getDboSession()->query<ListingId>("SELECT i.listing_id FROM " + buildInteractionSubquery(params.signals, true) + " i") };
        if (params.signals.contains(InteractionSignal::Weak))
            query.bind(params.user);
        if (params.signals.contains(InteractionSignal::Strong) || params.signals.contains(InteractionSignal::Medium))
            query.bind(params.user);

        query.groupBy("i.listing_id");
        query.orderBy("MAX(i.date_time) DESC, i.listing_id DESC");
        if (params.limit)
            query.limit(static_cast<int>(*params.limit));

        return utils::fetchQueryResults<ListingId>(query);
    }

    void Interaction::visitAggregatedWeights(Session& session, std::optional<std::size_t> pairCountLimit, AggregatedWeightVisitor visitor)
    {
        session.checkReadTransaction();

        if (pairCountLimit && *pairCountLimit == 0)
            return;

        const InteractionSignalSet allSignals{ InteractionSignal::Strong, InteractionSignal::Medium, InteractionSignal::Weak };

        using ResultType = std::tuple<UserId, ListingId, int>;
        auto query{ session.getDboSession()->query<ResultType>("SELECT i.user_id, i.listing_id, i.signal FROM " + buildInteractionSubquery(allSignals, false) + " i") };
        query.orderBy("i.user_id, i.listing_id");

        UserId currentUser;
        ListingId currentListing;
        double currentWeight{};
        std::size_t pairCount{};

        utils::forEachQueryResultWhile(query, [&](const ResultType& row) {
            const auto& [user, listing, signal]{ row };

            if (user == currentUser && listing == currentListing)
            {
                currentWeight += getSignalWeight(static_cast<InteractionSignal>(signal));
                return true;
            }

            if (currentListing.isValid())
            {
                visitor(currentUser, currentListing, currentWeight);
                if (pairCountLimit && ++pairCount == *pairCountLimit)
                {
                    currentListing = {};
                    return false;
                }
            }

            currentUser = user;
            currentListing = listing;
            currentWeight = getSignalWeight(static_cast<InteractionSignal>(signal));
            return true;
        });

        if (currentListing.isValid())
            visitor(currentUser, currentListing, currentWeight);
    }
} // namespace grouprank::db
