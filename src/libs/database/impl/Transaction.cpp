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

#include "database/Transaction.hpp"

#include <exception>

#include "TransactionChecker.hpp"

namespace grouprank::db
{
    WriteTransaction::WriteTransaction(std::shared_mutex& mutex, Wt::Dbo::Session& session)
        : _lock{ mutex }
        , _transaction{ session }
        , _uncaughtExceptionCount{ std::uncaught_exceptions() }
    {
#if GROUPRANK_CHECK_TRANSACTION_ACCESSES
        transactionChecker::onTransactionBegin(transactionChecker::AccessType::Write, _transaction.session());
#endif
    }

    WriteTransaction::~WriteTransaction()
    {
#if GROUPRANK_CHECK_TRANSACTION_ACCESSES
        transactionChecker::onTransactionEnd(transactionChecker::AccessType::Write, _transaction.session());
#endif

        if (std::uncaught_exceptions() > _uncaughtExceptionCount)
            _transaction.rollback();
        else
            _transaction.commit();
    }

    ReadTransaction::ReadTransaction(Wt::Dbo::Session& session)
        : _transaction{ session }
    {
#if GROUPRANK_CHECK_TRANSACTION_ACCESSES
        transactionChecker::onTransactionBegin(transactionChecker::AccessType::Read, _transaction.session());
#endif
    }

    ReadTransaction::~ReadTransaction()
    {
#if GROUPRANK_CHECK_TRANSACTION_ACCESSES
        transactionChecker::onTransactionEnd(transactionChecker::AccessType::Read, _transaction.session());
#endif
    }
} // namespace grouprank::db
