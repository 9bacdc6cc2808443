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
#include <span>
#include <unordered_map>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ItemItemSimilarityId.hpp"
#include "database/objects/ListingId.hpp"

namespace grouprank::db
{
    class Session;

    // Directed similarity between two listings, computed offline
    // Listing ids are not foreign keys: the table is rewritten as a whole and may be stale
    class ItemItemSimilarity final : public Object<ItemItemSimilarity, ItemItemSimilarityId>
    {
    public:
        ItemItemSimilarity() = default;

        struct Entry
        {
            ListingId source;
            ListingId neighbor;
            double similarity{};
            std::size_t commonUserCount{};

            bool operator==(const Entry& other) const = default;
        };

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ListingId source, ListingId neighbor);
        // ordered by similarity desc, then by neighbor
        static RangeResults<Entry> findNeighbors(Session& session, ListingId source, std::optional<Range> range = std::nullopt);
        // for each source, max similarity across the given neighbors. Sources without any match are not reported
        static std::unordered_map<ListingId, double> getMaxSimilarities(Session& session, std::span<const ListingId> sources, std::span<const ListingId> neighbors);

        // need a write transaction
        static void clear(Session& session);
        static void insert(Session& session, std::span<const Entry> entries, const Wt::WDateTime& updatedAt);

        ListingId getSourceId() const { return _sourceId; }
        ListingId getNeighborId() const { return _neighborId; }
        double getSimilarity() const { return _similarity; }
        std::size_t getCommonUserCount() const { return static_cast<std::size_t>(_commonUserCount); }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _sourceId, "source_id");
            Wt::Dbo::field(a, _neighborId, "neighbor_id");
            Wt::Dbo::field(a, _similarity, "similarity");
            Wt::Dbo::field(a, _commonUserCount, "common_user_count");
            Wt::Dbo::field(a, _updatedAt, "updated_at");
        }

    private:
        ListingId _sourceId;
        ListingId _neighborId;
        double _similarity{};
        long long _commonUserCount{};
        Wt::WDateTime _updatedAt;
    };
} // namespace grouprank::db
