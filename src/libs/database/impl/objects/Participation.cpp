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

#include "database/objects/Participation.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/User.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(grouprank::db::Participation)

namespace grouprank::db
{
    Participation::Participation(ObjectPtr<User> user, ObjectPtr<Listing> listing, const Wt::WDateTime& appliedDateTime)
        : _appliedDateTime{ utils::normalizeDateTime(appliedDateTime) }
        , _user{ getDboPtr(user) }
        , _listing{ getDboPtr(listing) }
    {
    }

    Participation::pointer Participation::create(Session& session, ObjectPtr<User> user, ObjectPtr<Listing> listing, const Wt::WDateTime& appliedDateTime)
    {
        return session.getDboSession()->add(std::unique_ptr<Participation>{ new Participation{ user, listing, appliedDateTime } });
    }

    std::size_t Participation::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM participation"));
    }

    Participation::pointer Participation::find(Session& session, ParticipationId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->find<Participation>().where("id = ?").bind(id));
    }

    Participation::pointer Participation::find(Session& session, UserId userId, ListingId listingId)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->find<Participation>().where("user_id = ?").bind(userId).where("listing_id = ?").bind(listingId));
    }

    UserId Participation::getUserId() const
    {
        return _user.id();
    }

    ListingId Participation::getListingId() const
    {
        return _listing.id();
    }

    void Participation::setStatus(ParticipationStatus status, const Wt::WDateTime& dateTime)
    {
        _status = status;
        _decidedDateTime = (status == ParticipationStatus::Applied) ? Wt::WDateTime{} : utils::normalizeDateTime(dateTime);
    }
} // namespace grouprank::db
