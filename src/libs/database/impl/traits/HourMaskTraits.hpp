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

#include "database/Types.hpp"

namespace Wt::Dbo
{
    // stored as an integer, bit i set if hour i is set
    template<>
    struct sql_value_traits<grouprank::db::HourMask, void> : public sql_value_traits<long long>
    {
        static_assert(grouprank::db::hourCount < sizeof(long long) * 8);

        static void bind(const grouprank::db::HourMask& mask, SqlStatement* statement, int column, int size)
        {
            sql_value_traits<long long>::bind(static_cast<long long>(mask.to_ullong()), statement, column, size);
        }

        static bool read(grouprank::db::HourMask& mask, SqlStatement* statement, int column, int size)
        {
            long long value;
            if (!sql_value_traits<long long>::read(value, statement, column, size) || value < 0)
            {
                mask.reset();
                return false;
            }

            mask = grouprank::db::HourMask{ static_cast<unsigned long long>(value) };
            return true;
        }
    };
} // namespace Wt::Dbo
