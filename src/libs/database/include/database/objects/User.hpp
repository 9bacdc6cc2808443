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

#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/UserId.hpp"

namespace grouprank::db
{
    class Session;

    class User final : public Object<User, UserId>
    {
    public:
        User() = default;

        struct FindParameters
        {
            std::optional<Range> range;

            FindParameters& setRange(std::optional<Range> _range)
            {
                range = _range;
                return *this;
            }
        };

        // accessors
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, UserId id);
        static pointer find(Session& session, std::string_view loginName);
        static RangeResults<UserId> find(Session& session, const FindParameters& params);

        const std::string& getLoginName() const { return _loginName; }
        ListingCategorySet getInterestedCategories() const { return _interestedCategories; }
        MarketSet getWishMarkets() const { return _wishMarkets; }
        HourMask getWishHours() const { return _wishHours; }

        // modifiers
        void setInterestedCategories(ListingCategorySet categories) { _interestedCategories = categories; }
        void setWishMarkets(MarketSet markets) { _wishMarkets = markets; }
        void setWishHours(HourMask hours) { _wishHours = hours; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _loginName, "login_name");
            Wt::Dbo::field(a, _interestedCategories, "interested_categories");
            Wt::Dbo::field(a, _wishMarkets, "wish_markets");
            Wt::Dbo::field(a, _wishHours, "wish_hours");
        }

    private:
        friend class Session;
        User(std::string_view loginName);
        static pointer create(Session& session, std::string_view loginName);

        std::string _loginName;
        ListingCategorySet _interestedCategories;
        MarketSet _wishMarkets;
        HourMask _wishHours;
    };
} // namespace grouprank::db
