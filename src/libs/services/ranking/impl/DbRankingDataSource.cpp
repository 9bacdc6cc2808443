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

#include "DbRankingDataSource.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Interaction.hpp"
#include "database/objects/ItemItemSimilarity.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/Rating.hpp"
#include "database/objects/User.hpp"

#include "GeoUtils.hpp"

namespace grouprank::ranking
{
    namespace
    {
        // keep well below the max number of host parameters allowed in a single statement
        constexpr std::size_t maxCandidateCountPerQuery{ 256 };

        std::optional<db::ListingCategory> validateCategory(db::ListingCategory category)
        {
            if (static_cast<std::size_t>(category) >= db::listingCategoryCount)
                return std::nullopt;
            return category;
        }

        std::optional<db::Market> validateMarket(db::Market market)
        {
            if (static_cast<std::size_t>(market) >= db::marketCount)
                return std::nullopt;
            return market;
        }
    } // namespace

    std::unique_ptr<IRankingDataSource> createDbRankingDataSource(db::IDb& db, core::logging::ILogger& logger)
    {
        return std::make_unique<DbRankingDataSource>(db, logger);
    }

    DbRankingDataSource::DbRankingDataSource(db::IDb& db, core::logging::ILogger& logger)
        : _db{ db }
        , _logger{ logger }
    {
    }

    std::vector<CandidateListing> DbRankingDataSource::fetchCandidates(const CandidateFilters& filters, const GeoPoint& location, double radiusKm, const Wt::WDateTime& now, std::size_t limit)
    {
        std::vector<CandidateListing> res;
        if (limit == 0)
            return res;

        db::Listing::CandidateFindParameters params;
        params.setStatus(db::ListingStatus::Recruiting);
        params.setScheduledAfter(now);
        params.setCategory(filters.category);
        params.setMarket(filters.market);
        params.setBoundingBox(geo::computeBoundingBox(location, radiusKm));

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Listing::findCandidates(session, params, [&](const db::Listing::CandidateEntry& entry) {
            const double distanceKm{ geo::computeDistanceKm(location, GeoPoint{ entry.latitude, entry.longitude }) };
            if (distanceKm > radiusKm)
                return true;

            if (!entry.scheduledDateTime.isValid() || !entry.createdDateTime.isValid())
            {
                GROUPRANK_LOG(_logger, RANKING, WARNING, "Skipping listing " << entry.id.toString() << ": invalid date time");
                return true;
            }

            CandidateListing& candidate{ res.emplace_back() };
            candidate.id = entry.id;
            candidate.category = validateCategory(entry.category);
            candidate.market = validateMarket(entry.market);
            candidate.scheduledHour = static_cast<unsigned>(entry.scheduledDateTime.time().hour());
            candidate.distanceKm = distanceKm;
            candidate.createdDateTime = entry.createdDateTime;
            candidate.hostReputation = db::Rating::computeReputation(entry.hostAverageStars);

            return res.size() < limit;
        });

        return res;
    }

    std::optional<UserProfileFeatures> DbRankingDataSource::fetchUserProfile(db::UserId userId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::User::pointer user{ db::User::find(session, userId) };
        if (!user)
            return std::nullopt;

        UserProfileFeatures profile;
        profile.interestedCategories = user->getInterestedCategories();
        profile.wishMarkets = user->getWishMarkets();
        profile.wishHours = user->getWishHours();

        return profile;
    }

    std::vector<db::ListingId> DbRankingDataSource::fetchUserHistory(db::UserId user, std::size_t limit)
    {
        if (limit == 0)
            return {};

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        // a listing both favorited and joined counts once
        db::Interaction::FindParameters params;
        params.setUser(user);
        params.setSignals({ db::InteractionSignal::Strong, db::InteractionSignal::Weak });
        params.setLimit(limit);

        return db::Interaction::findRecentListings(session, params);
    }

    std::vector<InteractionRecord> DbRankingDataSource::fetchWeightedInteractions(db::UserId user, std::size_t limit)
    {
        std::vector<InteractionRecord> res;
        if (limit == 0)
            return res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Interaction::FindParameters params;
        params.setUser(user);
        params.setLimit(limit);

        for (const db::Interaction::Entry& entry : db::Interaction::findRecent(session, params))
            res.push_back(InteractionRecord{ entry.listing, entry.signal, db::getSignalWeight(entry.signal), entry.dateTime });

        return res;
    }

    std::unordered_map<db::ListingId, double> DbRankingDataSource::fetchSimilarity(std::span<const db::ListingId> candidates, std::span<const db::ListingId> history)
    {
        std::unordered_map<db::ListingId, double> res;
        if (candidates.empty() || history.empty())
            return res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        for (std::size_t offset{}; offset < candidates.size(); offset += maxCandidateCountPerQuery)
        {
            const std::size_t count{ std::min(maxCandidateCountPerQuery, candidates.size() - offset) };
            res.merge(db::ItemItemSimilarity::getMaxSimilarities(session, candidates.subspan(offset, count), history));
        }

        return res;
    }
} // namespace grouprank::ranking
