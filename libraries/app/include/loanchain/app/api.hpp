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

#include <loanchain/chain/database.hpp>

#include <fc/api.hpp>
#include <fc/optional.hpp>

#include <string>
#include <vector>

namespace loanchain { namespace app {
   using namespace loanchain::chain;

   using std::string;
   using std::vector;

   /**
    * @brief The ledger_api class implements the RPC API of the loan ledger
    *
    * All methods but @ref broadcast_transaction_synchronous only read the ledger.
    */
   class ledger_api
   {
      public:
         explicit ledger_api( chain::database& db );

         /// @return current ledger time
         time_point_sec get_head_time()const;

         /// @return id the next requested loan will get, every lower id names an existing loan
         loan_id_type get_next_loan_id()const;

         /**
          * @brief Get a loan by id
          * @return the loan, or null if no loan with this id exists
          */
         optional<loan_object> get_loan( loan_id_type id )const;

         /// @return ids of the loans that are active or in a default vote, in ascending order
         vector<loan_id_type> get_active_loan_ids()const;

         /// @return contributions to a loan in the order lenders contributed
         vector<loan_contribution_object> get_contributions( loan_id_type id )const;

         /// @return lifecycle events of a loan in the order they happened
         vector<loan_event_object> get_loan_events( loan_id_type id )const;

         token_object get_token( token_id_type id )const;
         vector<token_object> list_tokens()const;

         /**
          * @brief Value an amount of a token in USD
          * @return USD amount with 8 decimals and the time of the quote it is based on
          * @throws stale_quote if the quote is too old or the feed cannot be read
          */
         usd_valuation get_usd_value( token_id_type token, const amount_type& raw_amount )const;

         optional<account_object> get_account_by_name( const string& name )const;

         /// @return the sequence the next transaction of @p account must carry
         uint32_t get_next_sequence( account_id_type account )const;

         amount_type get_balance( account_id_type account, token_id_type token )const;

         /**
          * @brief Apply a transaction and wait for the result
          *
          * Returns once the transaction has been applied and the sequence of its signer advanced,
          * or throws if the transaction was rejected.
          */
         processed_transaction broadcast_transaction_synchronous( const transaction& trx );

      private:
         chain::database& _db;
   };

} } // loanchain::app

FC_API( loanchain::app::ledger_api,
        (get_head_time)
        (get_next_loan_id)
        (get_loan)
        (get_active_loan_ids)
        (get_contributions)
        (get_loan_events)
        (get_token)
        (list_tokens)
        (get_usd_value)
        (get_account_by_name)
        (get_next_sequence)
        (get_balance)
        (broadcast_transaction_synchronous)
      )
