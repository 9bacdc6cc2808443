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
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ListingId.hpp"
#include "database/objects/ParticipationId.hpp"
#include "database/objects/UserId.hpp"

namespace grouprank::db
{
    class Listing;
    class Session;
    class User;

    class Participation final : public Object<Participation, ParticipationId>
    {
    public:
        Participation() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ParticipationId id);
        static pointer find(Session& session, UserId userId, ListingId listingId);

        ParticipationStatus getStatus() const { return _status; }
        const Wt::WDateTime& getAppliedDateTime() const { return _appliedDateTime; }
        const Wt::WDateTime& getDecidedDateTime() const { return _decidedDateTime; } // invalid while undecided
        UserId getUserId() const;
        ListingId getListingId() const;

        // Sets the decided date time as well, unless the status is back to Applied
        void setStatus(ParticipationStatus status, const Wt::WDateTime& dateTime);

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _status, "status");
            Wt::Dbo::field(a, _appliedDateTime, "applied_date_time");
            Wt::Dbo::field(a, _decidedDateTime, "decided_date_time");

            Wt::Dbo::belongsTo(a, _user, "user", Wt::Dbo::OnDeleteCascade);
            Wt::Dbo::belongsTo(a, _listing, "listing", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;
        Participation(ObjectPtr<User> user, ObjectPtr<Listing> listing, const Wt::WDateTime& appliedDateTime);
        static pointer create(Session& session, ObjectPtr<User> user, ObjectPtr<Listing> listing, const Wt::WDateTime& appliedDateTime);

        ParticipationStatus _status{ ParticipationStatus::Applied };
        Wt::WDateTime _appliedDateTime;
        Wt::WDateTime _decidedDateTime;

        Wt::Dbo::ptr<User> _user;
        Wt::Dbo::ptr<Listing> _listing;
    };
} // namespace grouprank::db
