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

#include "database/IdType.hpp"

namespace grouprank::db
{
    namespace
    {
        // same as Wt::Dbo's id of a transient object
        constexpr IdType::ValueType invalidId{ -1 };
    } // namespace

    IdType::IdType()
        : _id{ invalidId }
    {
    }

    IdType::IdType(ValueType id)
        : _id{ id }
    {
    }

    bool IdType::isValid() const
    {
        return _id != invalidId;
    }

    std::string IdType::toString() const
    {
        return isValid() ? std::to_string(_id) : "<invalid>";
    }
} // namespace grouprank::db
