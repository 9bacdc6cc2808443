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

#include "database/objects/ItemItemSimilarity.hpp"

#include <tuple>
#include <vector>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(grouprank::db::ItemItemSimilarity)

namespace grouprank::db
{
    std::size_t ItemItemSimilarity::getCount(Session& session)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM item_item_similarity"));
    }

    ItemItemSimilarity::pointer ItemItemSimilarity::find(Session& session, ListingId source, ListingId neighbor)
    {
        session.checkReadTransaction();
        return utils::fetchQuerySingleResult(session.getDboSession()->find<ItemItemSimilarity>().where("source_id = ?").bind(source).where("neighbor_id = ?").bind(neighbor));
    }

    RangeResults<ItemItemSimilarity::Entry> ItemItemSimilarity::findNeighbors(Session& session, ListingId source, std::optional<Range> range)
    {
        session.checkReadTransaction();

        using ResultType = std::tuple<ListingId, double, long long>;
        auto query{ session.getDboSession()->query<ResultType>("SELECT neighbor_id, similarity, common_user_count FROM item_item_similarity") };
        query.where("source_id = ?").bind(source);
        query.orderBy("similarity DESC, neighbor_id");

        const RangeResults<ResultType> rows{ utils::execRangeQuery<ResultType>(query, range) };

        RangeResults<Entry> res;
        res.range = rows.range;
        res.moreResults = rows.moreResults;
        res.results.reserve(rows.results.size());
        for (const auto& [neighbor, similarity, commonUserCount] : rows.results)
            res.results.push_back(Entry{ source, neighbor, similarity, static_cast<std::size_t>(commonUserCount) });

        return res;
    }

    std::unordered_map<ListingId, double> ItemItemSimilarity::getMaxSimilarities(Session& session, std::span<const ListingId> sources, std::span<const ListingId> neighbors)
    {
        session.checkReadTransaction();

        std::unordered_map<ListingId, double> res;
        if (sources.empty() || neighbors.empty())
            return res;

        using ResultType = std::tuple<ListingId, double>;
        auto query{ session.getDboSession()->query<ResultType>("SELECT source_id, MAX(similarity) FROM item_item_similarity") };

        query.where("source_id IN (" + utils::makePlaceholders(sources.size()) + ")");
        for (ListingId source : sources)
            query.bind(source);

        query.where("neighbor_id IN (" + utils::makePlaceholders(neighbors.size()) + ")");
        for (ListingId neighbor : neighbors)
            query.bind(neighbor);

        query.groupBy("source_id");

        utils::forEachQueryResult(query, [&](const ResultType& row) {
            res.emplace(std::get<0>(row), std::get<1>(row));
        });

        return res;
    }

    void ItemItemSimilarity::clear(Session& session)
    {
        session.checkWriteTransaction();
        utils::executeCommand(*session.getDboSession(), "DELETE FROM item_item_similarity");
    }

    void ItemItemSimilarity::insert(Session& session, std::span<const Entry> entries, const Wt::WDateTime& updatedAt)
    {
        session.checkWriteTransaction();

        const Wt::WDateTime normalizedUpdatedAt{ utils::normalizeDateTime(updatedAt) };
        for (const Entry& entry : entries)
        {
            utils::executeCommand(*session.getDboSession(),
                                  "INSERT INTO item_item_similarity (version, source_id, neighbor_id, similarity, common_user_count, updated_at) VALUES (0, ?, ?, ?, ?, ?)",
                                  entry.source, entry.neighbor, entry.similarity, static_cast<long long>(entry.commonUserCount), normalizedUpdatedAt);
        }
    }
} // namespace grouprank::db
