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
#include <loanchain/app/api.hpp>
#include <loanchain/app/application.hpp>

#include "application_impl.hxx"

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/rpc/websocket_api.hpp>
#include <fc/thread/thread.hpp>

#include <boost/filesystem/path.hpp>

#include <cctype>
#include <iostream>

namespace loanchain { namespace app {
using namespace loanchain::chain;
namespace bpo = boost::program_options;

genesis_state_type create_example_genesis()
{
   genesis_state_type initial_state;
   initial_state.initial_timestamp = time_point_sec( fc::time_point::now() );
   initial_state.admin_name = "admin";

   for( const auto& name : { "admin", "liquidator" } )
   {
      genesis_state_type::initial_account_type account;
      account.name = name;
      account.native_balance = pow10( 21 );
      initial_state.initial_accounts.push_back( account );
   }

   genesis_state_type::initial_token_type native;
   native.kind = token_kind::native;
   native.symbol = LOANCHAIN_SYMBOL;
   native.decimals = 18;
   native.price_feed = "ETH/USD";
   initial_state.initial_tokens.push_back( native );

   genesis_state_type::initial_token_type usd;
   usd.kind = token_kind::fungible;
   usd.symbol = "USDC";
   usd.asset_ref = "usdc";
   usd.decimals = 6;
   usd.price_feed = "USDC/USD";
   initial_state.initial_tokens.push_back( usd );

   genesis_state_type::initial_price_feed_type eth_feed;
   eth_feed.name = "ETH/USD";
   eth_feed.price = amount_type( 2000 ) * pow10( 8 );
   initial_state.initial_price_feeds.push_back( eth_feed );

   genesis_state_type::initial_price_feed_type usd_feed;
   usd_feed.name = "USDC/USD";
   usd_feed.price = pow10( 8 );
   initial_state.initial_price_feeds.push_back( usd_feed );

   initial_state.initial_balances.push_back( { "liquidator", "USDC", amount_type( 1000000 ) * pow10( 6 ) } );

   return initial_state;
}

namespace detail {

void application_impl::reset_websocket_server()
{ try {
   if( !_options->count("rpc-endpoint") )
      return;

   _websocket_server = std::make_shared<fc::http::websocket_server>();

   _websocket_server->on_connection([this]( const fc::http::websocket_connection_ptr& c ){
      auto wsc = std::make_shared<fc::rpc::websocket_api_connection>( c, LOANCHAIN_MAX_NESTED_OBJECTS );
      auto ledger = std::make_shared<ledger_api>( std::ref(*_chain_db) );
      wsc->register_api( fc::api<ledger_api>(ledger) );
      c->set_session_data( wsc );
   });
   ilog( "Configured websocket rpc to listen on ${ip}", ("ip",_options->at("rpc-endpoint").as<string>()) );
   _websocket_server->listen( fc::ip::endpoint::from_string(_options->at("rpc-endpoint").as<string>()) );
   _websocket_server->start_accept();
} FC_CAPTURE_AND_RETHROW() }

void application_impl::startup()
{ try {
   genesis_state_type genesis;
   if( _options->count("genesis-json") )
   {
      const fc::path genesis_file = _options->at("genesis-json").as<boost::filesystem::path>();
      ilog( "Loading genesis state from ${f}", ("f",genesis_file.generic_string()) );
      genesis = fc::json::from_file( genesis_file ).as<genesis_state_type>( LOANCHAIN_MAX_NESTED_OBJECTS );
   }
   else
   {
      wlog( "No genesis file given, starting an example ledger" );
      genesis = create_example_genesis();
   }
   _chain_db->init_genesis( genesis );

   _chain_db->loan_event_applied.connect( []( const loan_event_object& e ) {
      ilog( "Loan ${l}: ${t} at ${time}", ("l",e.loan)("t",e.type)("time",e.time) );
   });

   if( _options->count("clock-interval") )
      _clock_interval = _options->at("clock-interval").as<uint32_t>();
   FC_ASSERT( _clock_interval > 0, "Clock interval should be positive" );

   reset_websocket_server();
   schedule_clock_loop();
} FC_CAPTURE_AND_RETHROW() }

void application_impl::shutdown()
{
   if( _clock_task.valid() && !_clock_task.ready() )
   {
      try {
         _clock_task.cancel_and_wait( __FUNCTION__ );
      } catch( const fc::exception& e ) {
         wlog( "Caught exception while canceling the ledger clock: ${e}", ("e",e.to_detail_string()) );
      }
   }
   _websocket_server.reset();
}

void application_impl::schedule_clock_loop()
{
   fc::time_point next_wakeup = fc::time_point::now() + fc::seconds( _clock_interval );
   _clock_task = fc::schedule( [this]{ clock_loop(); }, next_wakeup, "Ledger clock" );
}

void application_impl::clock_loop()
{
   const time_point_sec now( fc::time_point::now() );
   try {
      if( now > _chain_db->head_time() )
         _chain_db->advance_time( now );
   } catch( const fc::canceled_exception& ) {
      throw;
   } catch( const fc::exception& e ) {
      elog( "Failed to advance ledger time to ${t}: ${e}", ("t",now)("e",e.to_detail_string()) );
   }
   schedule_clock_loop();
}

} // namespace detail

application::application()
   : my(std::make_shared<detail::application_impl>(this))
{}

application::~application()
{
   shutdown();
}

void application::set_program_options( bpo::options_description& command_line_options,
                                       bpo::options_description& configuration_file_options )const
{
   configuration_file_options.add_options()
         ("rpc-endpoint", bpo::value<string>()->implicit_value("127.0.0.1:8090"), "Endpoint for websocket RPC to listen on")
         ("genesis-json", bpo::value<boost::filesystem::path>(), "File to read Genesis State from")
         ("clock-interval", bpo::value<uint32_t>()->default_value(1), "Seconds between two advances of ledger time")
         ;
   command_line_options.add(configuration_file_options);
   command_line_options.add_options()
         ("create-genesis-json", bpo::value<boost::filesystem::path>(),
          "Path to create a Genesis State at. If a well-formed JSON file exists at the path, it will be parsed and "
          "written back with any missing fields filled in. Otherwise an example Genesis State is written.")
         ;
}

void application::initialize( const fc::path& data_dir, std::shared_ptr<bpo::variables_map> options )const
{
   my->_data_dir = data_dir;
   my->_options = options;

   if( options->count("create-genesis-json") )
   {
      fc::path genesis_out = options->at("create-genesis-json").as<boost::filesystem::path>();
      genesis_state_type genesis_state = create_example_genesis();
      if( fc::exists(genesis_out) )
      {
         try {
            genesis_state = fc::json::from_file(genesis_out).as<genesis_state_type>( LOANCHAIN_MAX_NESTED_OBJECTS );
         } catch( const fc::exception& e ) {
            std::cerr << "Unable to parse existing genesis file:\n" << e.to_string()
                      << "\nWould you like to replace it? [y/N] ";
            char response = std::cin.get();
            if( toupper(response) != 'Y' )
               return;
         }

         std::cerr << "Updating genesis state in file " << genesis_out.generic_string() << "\n";
      } else {
         std::cerr << "Creating example genesis state in file " << genesis_out.generic_string() << "\n";
      }
      fc::json::save_to_file( genesis_state, genesis_out );

      std::exit(EXIT_SUCCESS);
   }
}

void application::startup()
{
   my->startup();
}

void application::shutdown()
{
   my->shutdown();
   my->_chain_db->close();
}

std::shared_ptr<chain::database> application::chain_database()const
{
   return my->_chain_db;
}

} } // namespace loanchain::app
