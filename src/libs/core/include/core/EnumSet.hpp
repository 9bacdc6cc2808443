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

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <type_traits>

namespace grouprank::core
{
    // Set of enum values stored as a bitfield, values must fit the underlying type width
    template<typename T, typename underlying_type = std::uint32_t>
    class EnumSet
    {
        static_assert(std::is_enum_v<T>);
        static_assert(std::is_same_v<underlying_type, std::uint64_t> || std::is_same_v<underlying_type, std::uint32_t>);

        using IndexType = std::uint_fast8_t;

    public:
        using ValueType = underlying_type;

        constexpr EnumSet() = default;
        constexpr EnumSet(std::initializer_list<T> values)
        {
            for (T value : values)
                insert(value);
        }

        template<typename It>
        constexpr EnumSet(It begin, It end)
        {
            assign(begin, end);
        }

        template<typename It>
        constexpr void assign(It begin, It end)
        {
            clear();
            for (It it{ begin }; it != end; ++it)
                insert(*it);
        }

        constexpr void insert(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            _bitfield |= (underlying_type{ 1 } << static_cast<underlying_type>(value));
        }

        constexpr void erase(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            _bitfield &= ~(underlying_type{ 1 } << static_cast<underlying_type>(value));
        }

        constexpr bool empty() const { return _bitfield == 0; }

        constexpr bool contains(T value) const
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            return _bitfield & (underlying_type{ 1 } << static_cast<underlying_type>(value));
        }

        constexpr std::size_t size() const
        {
            std::size_t res{};
            for (underlying_type bitfield{ _bitfield }; bitfield; bitfield >>= 1)
                res += (bitfield & 1);
            return res;
        }

        constexpr void clear() { _bitfield = 0; }

        class iterator
        {
        public:
            using value_type = T;

            constexpr value_type operator*() const
            {
                return static_cast<value_type>(_index);
            }

            constexpr bool operator==(const iterator& _other) const
            {
                return &_container == &_other._container && _index == _other._index;
            }

            constexpr iterator& operator++()
            {
                _index = _container.getFirstBitSetIndex(_index + 1);
                return *this;
            }

        private:
            friend class EnumSet;

            constexpr iterator(const EnumSet& container, IndexType index)
                : _container{ container }
                , _index{ index }
            {
            }

            const EnumSet& _container;
            IndexType _index;
        };

        constexpr iterator begin() const { return iterator{ *this, getFirstBitSetIndex() }; }
        constexpr iterator end() const { return iterator{ *this, npos }; }

        constexpr underlying_type getBitfield() const { return _bitfield; }
        constexpr void setBitfield(underlying_type bitfield) { _bitfield = bitfield; }

        constexpr bool operator==(const EnumSet& other) const = default;

    private:
        static_assert(std::numeric_limits<IndexType>::max() >= sizeof(underlying_type) * 8);
        static constexpr IndexType npos{ sizeof(underlying_type) * 8 };

        constexpr IndexType getFirstBitSetIndex(IndexType start = {}) const
        {
            // return npos if no bit found
            for (IndexType index{ start }; index < npos; ++index)
            {
                if (_bitfield & (underlying_type{ 1 } << index))
                    return index;
            }

            return npos;
        }

        underlying_type _bitfield{};
    };
} // namespace grouprank::core
