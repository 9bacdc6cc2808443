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
#include <utility>

#include <Wt/Dbo/Dbo.h>
#include <Wt/Dbo/ptr.h>

#include "database/IdType.hpp"

namespace grouprank::db
{
    namespace details
    {
        // no-op unless transaction accesses are checked
        void checkWriteAccess(Wt::Dbo::Session& session);
    } // namespace details

    // Read-only handle on a persisted object, writes must go through modify()
    template<typename T>
    class ObjectPtr
    {
    public:
        ObjectPtr() = default;
        ObjectPtr(Wt::Dbo::ptr<T> obj)
            : _obj{ std::move(obj) } {}

        const T* operator->() const { return _obj.get(); }
        operator bool() const { return _obj.get() != nullptr; }
        bool operator==(const ObjectPtr& other) const { return _obj == other._obj; }

        auto modify()
        {
            details::checkWriteAccess(*_obj.session());
            return _obj.modify();
        }

        void remove()
        {
            details::checkWriteAccess(*_obj.session());
            _obj.remove();
        }

    private:
        template<typename, typename>
        friend class Object;

        Wt::Dbo::ptr<T> _obj;
    };

    template<typename T, typename ObjectIdType>
    class Object : public Wt::Dbo::Dbo<T>
    {
        static_assert(std::is_base_of_v<db::IdType, ObjectIdType> && !std::is_same_v<db::IdType, ObjectIdType>, "ObjectIdType must be a dedicated IdType");

    public:
        using pointer = ObjectPtr<T>;
        using IdType = ObjectIdType;

        IdType getId() const { return IdType{ Wt::Dbo::Dbo<T>::id() }; }

    protected:
        // only objects can reach the underlying dbo ptr, to set up relations
        template<typename Other>
        static const Wt::Dbo::ptr<Other>& getDboPtr(const ObjectPtr<Other>& ptr)
        {
            return ptr._obj;
        }
    };
} // namespace grouprank::db
