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

#include "database/objects/Favorite.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/User.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(grouprank::db::Favorite)

namespace grouprank::db
{
    Favorite::Favorite(ObjectPtr<User> user, ObjectPtr<Listing> listing, const Wt::WDateTime& createdDateTime)
        : _createdDateTime{ utils::normalizeDateTime(createdDateTime) }
        , _user{ getDboPtr(user) }
        , _listing{ getDboPtr(listing) }
    {
    }

    Favorite::pointer Favorite::create(Session& session, ObjectPtr<User> user, ObjectPtr<Listing> listing, const Wt::WDateTime& createdDateTime)
    {
        return session.getDboSession()->add(std::unique_ptr<Favorite>{ new Favorite{ user, listing, createdDateTime } });
    }

    std::size_t Favorite::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM favorite"));
    }

    Favorite::pointer Favorite::find(Session& session, FavoriteId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->find<Favorite>().where("id = ?").bind(id));
    }

    Favorite::pointer Favorite::find(Session& session, UserId userId, ListingId listingId)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->find<Favorite>().where("user_id = ?").bind(userId).where("listing_id = ?").bind(listingId));
    }

    UserId Favorite::getUserId() const
    {
        return _user.id();
    }

    ListingId Favorite::getListingId() const
    {
        return _listing.id();
    }
} // namespace grouprank::db
