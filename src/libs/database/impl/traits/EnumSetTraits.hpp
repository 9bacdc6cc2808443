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

#include <Wt/Dbo/StdSqlTraits.h>

#include "core/EnumSet.hpp"

namespace Wt::Dbo
{
    // stored as the integer bitfield
    template<typename E>
    struct sql_value_traits<grouprank::core::EnumSet<E>, void> : public sql_value_traits<long long>
    {
        using Bitfield = typename grouprank::core::EnumSet<E>::ValueType;
        static_assert(sizeof(Bitfield) < sizeof(long long));

        static void bind(const grouprank::core::EnumSet<E>& set, SqlStatement* statement, int column, int size)
        {
            sql_value_traits<long long>::bind(static_cast<long long>(set.getBitfield()), statement, column, size);
        }

        static bool read(grouprank::core::EnumSet<E>& set, SqlStatement* statement, int column, int size)
        {
            long long value;
            if (!sql_value_traits<long long>::read(value, statement, column, size))
            {
                set.clear();
                return false;
            }

            set.setBitfield(static_cast<Bitfield>(value));
            return true;
        }
    };
} // namespace Wt::Dbo
