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

#include <loanchain/liquidator/ledger_client.hpp>
#include <loanchain/app/api.hpp>

namespace loanchain { namespace liquidator {

   /**
    *  @brief runs the monitor inside the ledger node
    *
    *  Reads go straight to the database and a submitted transaction is applied before
    *  @ref submit_and_wait returns, so the timeout never expires.
    */
   class database_ledger_client : public ledger_client
   {
      public:
         explicit database_ledger_client( chain::database& db ) : _api( db ) {}

         void connect() override {}
         bool is_connected()const override { return true; }

         time_point_sec get_head_time() override;
         loan_id_type get_next_loan_id() override;
         optional<loan_object> get_loan( loan_id_type id ) override;
         usd_valuation get_usd_value( token_id_type token, const amount_type& raw_amount ) override;
         optional<account_object> get_account_by_name( const std::string& name ) override;
         uint32_t get_next_sequence( account_id_type account ) override;
         vector<token_object> list_tokens() override;
         amount_type get_balance( account_id_type account, token_id_type token ) override;
         processed_transaction submit_and_wait( const transaction& trx, fc::microseconds timeout ) override;

      private:
         app::ledger_api _api;
   };

} } // loanchain::liquidator
