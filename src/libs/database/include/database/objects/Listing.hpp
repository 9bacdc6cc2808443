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

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ListingId.hpp"
#include "database/objects/UserId.hpp"

namespace grouprank::db
{
    class Session;
    class User;

    class Listing final : public Object<Listing, ListingId>
    {
    public:
        Listing() = default;

        struct FindParameters
        {
            std::optional<ListingStatus> status;
            UserId host;
            std::optional<Range> range;

            FindParameters& setStatus(std::optional<ListingStatus> _status)
            {
                status = _status;
                return *this;
            }
            FindParameters& setHost(UserId _host)
            {
                host = _host;
                return *this;
            }
            FindParameters& setRange(std::optional<Range> _range)
            {
                range = _range;
                return *this;
            }
        };

        // Listings that users may join, most recently created first
        struct CandidateFindParameters
        {
            ListingStatus status{ ListingStatus::Recruiting };
            Wt::WDateTime scheduledAfter; // strictly after, if set
            std::optional<ListingCategory> category;
            std::optional<Market> market;
            std::optional<GeoBoundingBox> boundingBox;

            CandidateFindParameters& setStatus(ListingStatus _status)
            {
                status = _status;
                return *this;
            }
            CandidateFindParameters& setScheduledAfter(const Wt::WDateTime& _scheduledAfter)
            {
                scheduledAfter = _scheduledAfter;
                return *this;
            }
            CandidateFindParameters& setCategory(std::optional<ListingCategory> _category)
            {
                category = _category;
                return *this;
            }
            CandidateFindParameters& setMarket(std::optional<Market> _market)
            {
                market = _market;
                return *this;
            }
            CandidateFindParameters& setBoundingBox(std::optional<GeoBoundingBox> _boundingBox)
            {
                boundingBox = _boundingBox;
                return *this;
            }
        };

        struct CandidateEntry
        {
            ListingId id;
            UserId host;
            ListingCategory category;
            Market market;
            double latitude{};
            double longitude{};
            Wt::WDateTime scheduledDateTime;
            Wt::WDateTime createdDateTime;
            double hostAverageStars{}; // default stars if the host has no rating
        };

        // accessors
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ListingId id);
        static RangeResults<ListingId> find(Session& session, const FindParameters& params);
        // func returns false to stop the iteration
        static void findCandidates(Session& session, const CandidateFindParameters& params, std::function<bool(const CandidateEntry&)> func);

        const std::string& getTitle() const { return _title; }
        ListingCategory getCategory() const { return _category; }
        Market getMarket() const { return _market; }
        ListingStatus getStatus() const { return _status; }
        double getLatitude() const { return _latitude; }
        double getLongitude() const { return _longitude; }
        const Wt::WDateTime& getScheduledDateTime() const { return _scheduledDateTime; }
        const Wt::WDateTime& getCreatedDateTime() const { return _createdDateTime; }
        UserId getHostId() const;
        ObjectPtr<User> getHost() const;

        // modifiers
        void setTitle(std::string_view title) { _title = title; }
        void setCategory(ListingCategory category) { _category = category; }
        void setMarket(Market market) { _market = market; }
        void setStatus(ListingStatus status) { _status = status; }
        void setLocation(double latitude, double longitude)
        {
            _latitude = latitude;
            _longitude = longitude;
        }
        void setScheduledDateTime(const Wt::WDateTime& dateTime);
        void setCreatedDateTime(const Wt::WDateTime& dateTime);

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _title, "title");
            Wt::Dbo::field(a, _category, "category");
            Wt::Dbo::field(a, _market, "market");
            Wt::Dbo::field(a, _status, "status");
            Wt::Dbo::field(a, _latitude, "latitude");
            Wt::Dbo::field(a, _longitude, "longitude");
            Wt::Dbo::field(a, _scheduledDateTime, "scheduled_date_time");
            Wt::Dbo::field(a, _createdDateTime, "created_date_time");

            Wt::Dbo::belongsTo(a, _host, "host", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;
        Listing(ObjectPtr<User> host, std::string_view title);
        static pointer create(Session& session, ObjectPtr<User> host, std::string_view title);

        std::string _title;
        ListingCategory _category{ ListingCategory::Household };
        Market _market{ Market::Other };
        ListingStatus _status{ ListingStatus::Draft };
        double _latitude{};
        double _longitude{};
        Wt::WDateTime _scheduledDateTime;
        Wt::WDateTime _createdDateTime;

        Wt::Dbo::ptr<User> _host;
    };
} // namespace grouprank::db
