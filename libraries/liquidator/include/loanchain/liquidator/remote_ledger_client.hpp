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

#include <fc/network/http/websocket.hpp>
#include <fc/rpc/websocket_api.hpp>

#include <boost/signals2/connection.hpp>

#include <atomic>
#include <memory>

namespace loanchain { namespace liquidator {

   /**
    *  @brief talks to a ledger node over its websocket RPC endpoint
    *
    *  The connection counts as lost as soon as the server closes it, or when a read gets no answer
    *  within the read timeout. Calls made while it is lost, and calls that fail because it was
    *  lost, throw @ref ledger_unavailable_exception.
    */
   class remote_ledger_client : public ledger_client
   {
      public:
         explicit remote_ledger_client( std::string endpoint, fc::microseconds read_timeout = fc::seconds( 30 ) );
         ~remote_ledger_client() override;

         void connect() override;
         bool is_connected()const override;
         void disconnect();

         time_point_sec get_head_time() override;
         loan_id_type get_next_loan_id() override;
         optional<loan_object> get_loan( loan_id_type id ) override;
         usd_valuation get_usd_value( token_id_type token, const amount_type& raw_amount ) override;
         optional<account_object> get_account_by_name( const std::string& name ) override;
         uint32_t get_next_sequence( account_id_type account ) override;
         vector<token_object> list_tokens() override;
         amount_type get_balance( account_id_type account, token_id_type token ) override;
         processed_transaction submit_and_wait( const transaction& trx, fc::microseconds timeout ) override;

         const std::string& endpoint()const { return _endpoint; }

      private:
         using api_type = fc::api<app::ledger_api>;

         template<typename Call>
         auto invoke( const char* method, Call&& call ) -> decltype( call( std::declval<api_type&>() ) );

         std::string                                       _endpoint;
         fc::microseconds                                  _read_timeout;
         std::shared_ptr<fc::http::websocket_client>       _client;
         fc::http::websocket_connection_ptr                _connection;
         std::shared_ptr<fc::rpc::websocket_api_connection> _api_connection;
         optional<api_type>                                _api;
         boost::signals2::scoped_connection                _closed_connection;
         // cleared by the close handler on the websocket thread
         std::atomic<bool>                                 _connected{ false };
   };

} } // loanchain::liquidator
