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
#include <vector>

#include <Wt/Dbo/Call.h>
#include <Wt/Dbo/Query.h>
#include <Wt/Dbo/Session.h>
#include <Wt/Dbo/collection.h>
#include <Wt/WDateTime.h>

#include "database/Types.hpp"

namespace grouprank::db::utils
{
    Wt::WDateTime normalizeDateTime(const Wt::WDateTime& dateTime);

    // "?, ?, ?" to be used in "IN (...)" clauses
    std::string makePlaceholders(std::size_t count);

    template<typename Query, typename UnaryFunc>
    void forEachQueryResult(const Query& query, UnaryFunc&& func)
    {
        for (const auto& result : query.resultList())
            func(result);
    }

    // stops as soon as func returns false
    template<typename Query, typename UnaryFunc>
    void forEachQueryResultWhile(const Query& query, UnaryFunc&& func)
    {
        for (const auto& result : query.resultList())
        {
            if (!func(result))
                break;
        }
    }

    template<typename T, typename Query>
    std::vector<T> fetchQueryResults(const Query& query)
    {
        std::vector<T> res;
        forEachQueryResult(query, [&](const T& result) { res.push_back(result); });
        return res;
    }

    template<typename Query>
    auto fetchQuerySingleResult(const Query& query)
    {
        return query.resultValue();
    }

    // One more row is fetched to know if there are more results
    template<typename ResultType, typename Query>
    RangeResults<ResultType> execRangeQuery(Query& query, std::optional<Range> range)
    {
        if (range)
        {
            query.limit(static_cast<int>(range->size + 1));
            if (range->offset > 0)
                query.offset(static_cast<int>(range->offset));
        }

        RangeResults<ResultType> res;
        res.results = fetchQueryResults<ResultType>(query);
        if (range)
        {
            res.range.offset = range->offset;
            if (res.results.size() > range->size)
            {
                res.moreResults = true;
                res.results.resize(range->size);
            }
        }
        res.range.size = res.results.size();

        return res;
    }

    template<typename... Args>
    void executeCommand(Wt::Dbo::Session& session, std::string_view command, const Args&... args)
    {
        Wt::Dbo::Call call{ session.execute(std::string{ command }) };
        (call.bind(args), ...);
        call.run();
    }
} // namespace grouprank::db::utils
