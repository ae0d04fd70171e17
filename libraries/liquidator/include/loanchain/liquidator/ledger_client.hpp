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

#include <loanchain/chain/loan_object.hpp>
#include <loanchain/chain/account_object.hpp>
#include <loanchain/chain/token_object.hpp>
#include <loanchain/chain/valuation.hpp>
#include <loanchain/protocol/transaction.hpp>

#include <loanchain/liquidator/exceptions.hpp>

#include <fc/optional.hpp>
#include <fc/thread/thread.hpp>

#include <string>

namespace loanchain { namespace liquidator {
   using namespace loanchain::chain;

   /**
    *  @brief the monitor's view of the ledger
    *
    *  Every call may suspend the calling task. Implementations report a ledger that cannot be
    *  reached with @ref ledger_unavailable_exception and let errors reported by the ledger itself
    *  pass unchanged.
    */
   class ledger_client
   {
      public:
         virtual ~ledger_client() = default;

         /// Opens the connection, throws @ref ledger_unavailable_exception on failure
         virtual void connect() = 0;
         virtual bool is_connected()const = 0;

         virtual time_point_sec get_head_time() = 0;
         virtual loan_id_type get_next_loan_id() = 0;
         virtual optional<loan_object> get_loan( loan_id_type id ) = 0;
         virtual usd_valuation get_usd_value( token_id_type token, const amount_type& raw_amount ) = 0;
         virtual optional<account_object> get_account_by_name( const std::string& name ) = 0;
         virtual uint32_t get_next_sequence( account_id_type account ) = 0;
         virtual vector<token_object> list_tokens() = 0;
         virtual amount_type get_balance( account_id_type account, token_id_type token ) = 0;

         /**
          *  Submits @p trx and waits until the ledger applied it.
          *  @throws settlement_timeout_exception if no confirmation arrived within @p timeout
          */
         virtual processed_transaction submit_and_wait( const transaction& trx, fc::microseconds timeout ) = 0;
   };

   /**
    *  Runs @p call as a task of its own and waits at most @p timeout for its result. The task keeps
    *  running after a timeout, so @p call must own everything it uses.
    *  @throws ledger_unavailable_exception if no result arrived in time
    */
   template<typename Call>
   auto call_with_timeout( const char* what, fc::microseconds timeout, Call call ) -> decltype( call() )
   {
      fc::future<decltype( call() )> result = fc::async( std::move( call ), what );
      try
      {
         return result.wait( timeout );
      }
      catch( const fc::timeout_exception& )
      {
         FC_THROW_EXCEPTION( ledger_unavailable_exception, "${w} got no answer within ${t} ms",
                             ("w",what)("t",timeout.count() / 1000) );
      }
   }

} } // loanchain::liquidator
