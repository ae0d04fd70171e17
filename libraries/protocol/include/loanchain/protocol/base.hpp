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

namespace loanchain { namespace protocol {

   /**
    *  @defgroup operations Ledger Operations
    *
    *  An operation is the smallest unit of change to the ledger. Each operation names the account
    *  on whose behalf it acts; every account named by the operations of a transaction must be
    *  the signer of that transaction.
    *
    *  Operations perform their own stateless validation in validate(); everything that depends
    *  on the current ledger state is checked by the evaluator of the operation.
    */

   struct void_result{};
   using operation_result = fc::static_variant<void_result, object_id_type>;

   struct base_operation
   {
      void validate()const {}
   };

} } // loanchain::protocol

FC_REFLECT( loanchain::protocol::void_result, )
