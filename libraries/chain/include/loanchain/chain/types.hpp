/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once
#include <loanchain/protocol/types.hpp>
#include <loanchain/protocol/operations.hpp>
#include <loanchain/protocol/transaction.hpp>

#include <loanchain/db/generic_index.hpp>

namespace loanchain { namespace chain {
   using namespace loanchain::protocol;
   using loanchain::db::abstract_object;
   using loanchain::db::object;
   using loanchain::db::generic_index;
   using loanchain::db::by_id;
} }

/// Object types in the Implementation Space (enum impl_object_type (2.x.x))
LOANCHAIN_DEFINE_IDS(chain, implementation_ids, impl_,
                     /* 2.0.x */ (global_property)
                     /* 2.1.x */ (account_balance)
                     /* 2.2.x */ (loan_event)
                    )
