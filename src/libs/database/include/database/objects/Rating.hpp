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

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/objects/ListingId.hpp"
#include "database/objects/RatingId.hpp"
#include "database/objects/UserId.hpp"

namespace grouprank::db
{
    class Listing;
    class Session;
    class User;

    // Rating given by a participant (reviewer) to another member (reviewee) after a listing
    class Rating final : public Object<Rating, RatingId>
    {
    public:
        static constexpr int minStars{ 1 };
        static constexpr int maxStars{ 5 };
        static constexpr double defaultAverageStars{ 3.0 }; // used for members without any rating

        Rating() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, RatingId id);
        static double getAverageStars(Session& session, UserId reviewee); // defaultAverageStars if none

        // Maps an average number of stars to [0, 1]
        static double computeReputation(double averageStars);

        int getStars() const { return _stars; }
        UserId getReviewerId() const;
        UserId getRevieweeId() const;
        ListingId getListingId() const;

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _stars, "stars");

            Wt::Dbo::belongsTo(a, _listing, "listing", Wt::Dbo::OnDeleteCascade);
            Wt::Dbo::belongsTo(a, _reviewer, "reviewer", Wt::Dbo::OnDeleteCascade);
            Wt::Dbo::belongsTo(a, _reviewee, "reviewee", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;
        Rating(ObjectPtr<Listing> listing, ObjectPtr<User> reviewer, ObjectPtr<User> reviewee, int stars);
        static pointer create(Session& session, ObjectPtr<Listing> listing, ObjectPtr<User> reviewer, ObjectPtr<User> reviewee, int stars);

        int _stars{};

        Wt::Dbo::ptr<Listing> _listing;
        Wt::Dbo::ptr<User> _reviewer;
        Wt::Dbo::ptr<User> _reviewee;
    };
} // namespace grouprank::db
