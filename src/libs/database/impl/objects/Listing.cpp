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

#include "database/objects/Listing.hpp"

#include <tuple>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Rating.hpp"
#include "database/objects/User.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(grouprank::db::Listing)

namespace grouprank::db
{
    Listing::Listing(ObjectPtr<User> host, std::string_view title)
        : _title{ title }
        , _host{ getDboPtr(host) }
    {
    }

    Listing::pointer Listing::create(Session& session, ObjectPtr<User> host, std::string_view title)
    {
        return session.getDboSession()->add(std::unique_ptr<Listing>{ new Listing{ host, title } });
    }

    std::size_t Listing::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM listing"));
    }

    Listing::pointer Listing::find(Session& session, ListingId id)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->find<Listing>().where("id = ?").bind(id));
    }

    RangeResults<ListingId> Listing::find(Session& session, const FindParameters& params)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<ListingId>("SELECT l.id FROM listing l") };

        if (params.status)
            query.where("l.status = ?").bind(*params.status);
        if (params.host.isValid())
            query.where("l.host_id = ?").bind(params.host);

        query.orderBy("l.id");

        return utils::execRangeQuery<ListingId>(query, params.range);
    }

    void Listing::findCandidates(Session& session, const CandidateFindParameters& params, std::function<bool(const CandidateEntry&)> func)
    {
        session.checkReadTransaction();

        using ResultType = std::tuple<ListingId, UserId, ListingCategory, Market, double, double, Wt::WDateTime, Wt::WDateTime, double>;
        auto query{ session.getDboSession()->query<ResultType>("SELECT l.id, l.host_id, l.category, l.market, l.latitude, l.longitude, l.scheduled_date_time, l.created_date_time, COALESCE(r.avg_stars, " + std::to_string(Rating::defaultAverageStars) + ") FROM listing l") };
        query.leftJoin("(SELECT reviewee_id, AVG(stars) AS avg_stars FROM rating GROUP BY reviewee_id) r ON r.reviewee_id = l.host_id");

        query.where("l.status = ?").bind(params.status);
        if (params.scheduledAfter.isValid())
            query.where("l.scheduled_date_time > ?").bind(params.scheduledAfter);
        if (params.category)
            query.where("l.category = ?").bind(*params.category);
        if (params.market)
            query.where("l.market = ?").bind(*params.market);
        if (params.boundingBox)
        {
            query.where("l.latitude BETWEEN ? AND ?").bind(params.boundingBox->minLatitude).bind(params.boundingBox->maxLatitude);
            query.where("l.longitude BETWEEN ? AND ?").bind(params.boundingBox->minLongitude).bind(params.boundingBox->maxLongitude);
        }

        query.orderBy("l.created_date_time DESC, l.id DESC");

        utils::forEachQueryResultWhile(query, [&](const ResultType& res) {
            const CandidateEntry entry{
                .id = std::get<0>(res),
                .host = std::get<1>(res),
                .category = std::get<2>(res),
                .market = std::get<3>(res),
                .latitude = std::get<4>(res),
                .longitude = std::get<5>(res),
                .scheduledDateTime = std::get<6>(res),
                .createdDateTime = std::get<7>(res),
                .hostAverageStars = std::get<8>(res),
            };

            return func(entry);
        });
    }

    UserId Listing::getHostId() const
    {
        return _host.id();
    }

    ObjectPtr<User> Listing::getHost() const
    {
        return _host;
    }

    void Listing::setScheduledDateTime(const Wt::WDateTime& dateTime)
    {
        _scheduledDateTime = utils::normalizeDateTime(dateTime);
    }

    void Listing::setCreatedDateTime(const Wt::WDateTime& dateTime)
    {
        _createdDateTime = utils::normalizeDateTime(dateTime);
    }
} // namespace grouprank::db
