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

#ifndef GROUPRANK_CHECK_TRANSACTION_ACCESSES
    #define GROUPRANK_CHECK_TRANSACTION_ACCESSES 0
#endif

#if GROUPRANK_CHECK_TRANSACTION_ACCESSES

namespace Wt::Dbo
{
    class Session;
}

// Keeps track of the transactions opened by the current thread
namespace grouprank::db::transactionChecker
{
    enum class AccessType
    {
        Read,
        Write,
    };

    void onTransactionBegin(AccessType type, const Wt::Dbo::Session& session);
    void onTransactionEnd(AccessType type, const Wt::Dbo::Session& session);

    // Throws db::Exception if the innermost transaction of this thread does not grant the access
    void requireAccess(AccessType type, const Wt::Dbo::Session& session);
} // namespace grouprank::db::transactionChecker

#endif // GROUPRANK_CHECK_TRANSACTION_ACCESSES
