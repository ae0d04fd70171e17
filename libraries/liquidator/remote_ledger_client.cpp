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
#include <loanchain/liquidator/remote_ledger_client.hpp>
#include <loanchain/protocol/config.hpp>
#include <loanchain/protocol/exceptions.hpp>

#include <fc/thread/thread.hpp>

namespace loanchain { namespace liquidator {

remote_ledger_client::remote_ledger_client( std::string endpoint, fc::microseconds read_timeout )
   :_endpoint( std::move( endpoint ) ),
    _read_timeout( read_timeout )
{
   FC_ASSERT( !_endpoint.empty(), "A ledger endpoint is required" );
   FC_ASSERT( _read_timeout > fc::microseconds(), "Read timeout must be positive" );
}

remote_ledger_client::~remote_ledger_client()
{
   disconnect();
}

void remote_ledger_client::connect()
{
   disconnect();
   try
   {
      _client = std::make_shared<fc::http::websocket_client>();
      _connection = _client->connect( _endpoint );
      _api_connection = std::make_shared<fc::rpc::websocket_api_connection>( _connection,
                                                                             LOANCHAIN_MAX_NESTED_OBJECTS );
      _api = _api_connection->get_remote_api<app::ledger_api>( 0 );
      _closed_connection = _connection->closed.connect( [this] {
         _connected = false;
      } );
      _connected = true;
      ilog( "Connected to ledger at ${ep}", ("ep",_endpoint) );
   }
   catch( const fc::exception& e )
   {
      disconnect();
      FC_THROW_EXCEPTION( ledger_unavailable_exception, "Unable to connect to ${ep}: ${e}",
                          ("ep",_endpoint)("e",e.to_string()) );
   }
   catch( const std::exception& e )
   {
      disconnect();
      FC_THROW_EXCEPTION( ledger_unavailable_exception, "Unable to connect to ${ep}: ${e}",
                          ("ep",_endpoint)("e",e.what()) );
   }
}

bool remote_ledger_client::is_connected()const
{
   return _connected;
}

void remote_ledger_client::disconnect()
{
   _connected = false;
   _closed_connection.disconnect();
   _api.reset();
   _api_connection.reset();
   if( _connection )
   {
      try
      {
         _connection->close( 1000, "closed by liquidator" );
      }
      catch( const fc::exception& e )
      {
         dlog( "Closing connection to ${ep} failed: ${e}", ("ep",_endpoint)("e",e.to_detail_string()) );
      }
      _connection.reset();
   }
   _client.reset();
}

template<typename Call>
auto remote_ledger_client::invoke( const char* method, Call&& call ) -> decltype( call( std::declval<api_type&>() ) )
{
   LOANCHAIN_ASSERT( _connected && _api.valid(), ledger_unavailable_exception,
                     "Not connected to ${ep}, cannot call ${m}", ("ep",_endpoint)("m",method) );
   api_type api = *_api;
   try
   {
      return call_with_timeout( method, _read_timeout, [api, call]() mutable {
         return call( api );
      } );
   }
   catch( const fc::canceled_exception& )
   {
      throw;
   }
   catch( const ledger_unavailable_exception& e )
   {
      // a read without an answer means a dead socket, the next attempt opens a new one
      wlog( "No answer from ${ep}, dropping the connection: ${e}", ("ep",_endpoint)("e",e.to_string()) );
      disconnect();
      throw;
   }
   catch( const fc::exception& e )
   {
      // an error reported by the ledger leaves the connection open
      if( !_connected )
         FC_THROW_EXCEPTION( ledger_unavailable_exception, "Lost connection to ${ep} during ${m}: ${e}",
                             ("ep",_endpoint)("m",method)("e",e.to_string()) );
      throw;
   }
}

time_point_sec remote_ledger_client::get_head_time()
{
   return invoke( "get_head_time", []( api_type& api ) { return api->get_head_time(); } );
}

loan_id_type remote_ledger_client::get_next_loan_id()
{
   return invoke( "get_next_loan_id", []( api_type& api ) { return api->get_next_loan_id(); } );
}

optional<loan_object> remote_ledger_client::get_loan( loan_id_type id )
{
   return invoke( "get_loan", [id]( api_type& api ) { return api->get_loan( id ); } );
}

usd_valuation remote_ledger_client::get_usd_value( token_id_type token, const amount_type& raw_amount )
{
   return invoke( "get_usd_value", [token, raw_amount]( api_type& api ) {
      return api->get_usd_value( token, raw_amount );
   } );
}

optional<account_object> remote_ledger_client::get_account_by_name( const std::string& name )
{
   return invoke( "get_account_by_name", [name]( api_type& api ) { return api->get_account_by_name( name ); } );
}

uint32_t remote_ledger_client::get_next_sequence( account_id_type account )
{
   return invoke( "get_next_sequence", [account]( api_type& api ) { return api->get_next_sequence( account ); } );
}

vector<token_object> remote_ledger_client::list_tokens()
{
   return invoke( "list_tokens", []( api_type& api ) { return api->list_tokens(); } );
}

amount_type remote_ledger_client::get_balance( account_id_type account, token_id_type token )
{
   return invoke( "get_balance", [account, token]( api_type& api ) { return api->get_balance( account, token ); } );
}

processed_transaction remote_ledger_client::submit_and_wait( const transaction& trx, fc::microseconds timeout )
{
   LOANCHAIN_ASSERT( _connected && _api.valid(), ledger_unavailable_exception,
                     "Not connected to ${ep}, cannot submit a transaction", ("ep",_endpoint) );

   // the call keeps its own handle so it can finish after this method gave up waiting
   api_type api = *_api;
   fc::future<processed_transaction> confirmed = fc::async( [api, trx]() {
      return api->broadcast_transaction_synchronous( trx );
   }, "broadcast_transaction_synchronous" );

   try
   {
      return confirmed.wait( timeout );
   }
   catch( const fc::timeout_exception& )
   {
      FC_THROW_EXCEPTION( settlement_timeout_exception,
                          "Transaction ${n} of ${s} was not confirmed within ${t} ms",
                          ("n",trx.sequence)("s",trx.signer)("t",timeout.count() / 1000) );
   }
   catch( const fc::canceled_exception& )
   {
      throw;
   }
   catch( const fc::exception& e )
   {
      if( !_connected )
         FC_THROW_EXCEPTION( ledger_unavailable_exception,
                             "Lost connection to ${ep} while submitting transaction ${n}: ${e}",
                             ("ep",_endpoint)("n",trx.sequence)("e",e.to_string()) );
      throw;
   }
}

} } // loanchain::liquidator
