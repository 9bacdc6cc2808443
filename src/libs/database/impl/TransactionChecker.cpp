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
#include "TransactionChecker.hpp"

#if GROUPRANK_CHECK_TRANSACTION_ACCESSES

    #include <cassert>
    #include <string>
    #include <vector>

    #include "database/Types.hpp"

namespace grouprank::db::transactionChecker
{
    namespace
    {
        struct OpenTransaction
        {
            AccessType type;
            const Wt::Dbo::Session* session;
        };

        thread_local std::vector<OpenTransaction> openTransactions;

        const char* toString(AccessType type)
        {
            switch (type)
            {
            case AccessType::Read:
                return "read";
            case AccessType::Write:
                return "write";
            }
            return "unknown";
        }
    } // namespace

    void onTransactionBegin(AccessType type, const Wt::Dbo::Session& session)
    {
        if (!openTransactions.empty() && openTransactions.back().session != &session)
            throw Exception{ "Nested transaction opened on another session" };

        openTransactions.push_back(OpenTransaction{ type, &session });
    }

    void onTransactionEnd(AccessType type, const Wt::Dbo::Session& session)
    {
        // called from destructors, transactions are scoped objects
        assert(!openTransactions.empty());
        assert(openTransactions.back().type == type && openTransactions.back().session == &session);
        openTransactions.pop_back();
    }

    void requireAccess(AccessType type, const Wt::Dbo::Session& session)
    {
        if (openTransactions.empty() || openTransactions.back().session != &session)
            throw Exception{ std::string{ "No " } + toString(type) + " transaction opened on this session" };

        // write transactions also grant reads
        if (type == AccessType::Write && openTransactions.back().type != AccessType::Write)
            throw Exception{ "Write access attempted in a read transaction" };
    }
} // namespace grouprank::db::transactionChecker

#endif // GROUPRANK_CHECK_TRANSACTION_ACCESSES
