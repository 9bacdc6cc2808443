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

#include <type_traits>

#include <Wt/Dbo/StdSqlTraits.h>

#include "database/IdType.hpp"

namespace Wt::Dbo
{
    // any IdType derived type is stored as its raw value, a NULL column gives an invalid id
    template<typename Id>
    struct sql_value_traits<Id, std::enable_if_t<std::is_base_of_v<grouprank::db::IdType, Id>>> : public sql_value_traits<grouprank::db::IdType::ValueType>
    {
        using Base = sql_value_traits<grouprank::db::IdType::ValueType>;
        static_assert(!std::is_same_v<grouprank::db::IdType, Id>, "use a type declared with GROUPRANK_DECLARE_IDTYPE");

        static void bind(const Id& id, SqlStatement* statement, int column, int size)
        {
            Base::bind(id.getValue(), statement, column, size);
        }

        static bool read(Id& id, SqlStatement* statement, int column, int size)
        {
            grouprank::db::IdType::ValueType value;
            const bool notNull{ Base::read(value, statement, column, size) };
            id = notNull ? Id{ value } : Id{};
            return notNull;
        }
    };
} // namespace Wt::Dbo
