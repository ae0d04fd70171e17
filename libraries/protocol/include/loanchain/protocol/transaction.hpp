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
#include <loanchain/protocol/operations.hpp>

namespace loanchain { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * A transaction groups operations which are applied atomically: either all of them take
    * effect or none does.
    *
    * Transactions are ordered per signer by @ref sequence. The ledger accepts a transaction only
    * if its sequence equals the next sequence of the signer and advances it on success, so two
    * transactions built from the same sequence can never both apply.
    * @{
    */
   struct transaction
   {
      account_id_type   signer;
      uint32_t          sequence = 0;
      vector<operation> operations;

      /// Stateless checks of the transaction and all of its operations
      void validate()const;

      /// Accounts the operations act on behalf of
      flat_set<account_id_type> get_acting_accounts()const;
   };

   /**
    *  @brief the result of applying a transaction
    */
   struct processed_transaction : public transaction
   {
      processed_transaction() = default;
      explicit processed_transaction( const transaction& trx ):transaction(trx){}

      time_point_sec           applied_at;
      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // loanchain::protocol

FC_REFLECT( loanchain::protocol::transaction, (signer)(sequence)(operations) )
FC_REFLECT_DERIVED( loanchain::protocol::processed_transaction, (loanchain::protocol::transaction),
                    (applied_at)(operation_results) )
