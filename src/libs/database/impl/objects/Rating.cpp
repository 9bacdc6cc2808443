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

#include "database/objects/Rating.hpp"

#include <algorithm>

#include <Wt/Dbo/Impl.h>

#include "database/Session.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/User.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(grouprank::db::Rating)

namespace grouprank::db
{
    Rating::Rating(ObjectPtr<Listing> listing, ObjectPtr<User> reviewer, ObjectPtr<User> reviewee, int stars)
        : _stars{ std::clamp(stars, minStars, maxStars) }
        , _listing{ getDboPtr(listing) }
        , _reviewer{ getDboPtr(reviewer) }
        , _reviewee{ getDboPtr(reviewee) }
    {
    }

    Rating::pointer Rating::create(Session& session, ObjectPtr<Listing> listing, ObjectPtr<User> reviewer, ObjectPtr<User> reviewee, int stars)
    {
        return session.getDboSession()->add(std::unique_ptr<Rating>{ new Rating{ listing, reviewer, reviewee, stars } });
    }

    std::size_t Rating::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM rating"));
    }

    Rating::pointer Rating::find(Session& session, RatingId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->find<Rating>().where("id = ?").bind(id));
    }

    double Rating::getAverageStars(Session& session, UserId reviewee)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<double>("SELECT COALESCE(AVG(stars), " + std::to_string(defaultAverageStars) + ") FROM rating").where("reviewee_id = ?").bind(reviewee));
    }

    double Rating::computeReputation(double averageStars)
    {
        return std::clamp((averageStars - minStars) / (maxStars - minStars), 0.0, 1.0);
    }

    UserId Rating::getReviewerId() const
    {
        return _reviewer.id();
    }

    UserId Rating::getRevieweeId() const
    {
        return _reviewee.id();
    }

    ListingId Rating::getListingId() const
    {
        return _listing.id();
    }
} // namespace grouprank::db
