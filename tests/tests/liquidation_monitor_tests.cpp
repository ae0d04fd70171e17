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
#include <boost/test/unit_test.hpp>

#include <loanchain/liquidator/database_ledger_client.hpp>
#include <loanchain/liquidator/liquidation_monitor.hpp>

#include "../common/database_fixture.hpp"

#include <functional>
#include <map>
#include <set>

using namespace loanchain::chain;
using namespace loanchain::chain::test;
using namespace loanchain::liquidator;

namespace {

const token_id_type loan_token( 1 );
const token_id_type collateral_token( 0 );
const account_id_type keeper_id( 7 );

/**
 *  In-memory ledger with scriptable faults. USD values are the raw amount times a per-token price,
 *  settlements mark the loan liquidated and advance the keeper's sequence.
 */
class fake_ledger_client : public ledger_client
{
   public:
      fake_ledger_client()
      {
         head_time = time_point_sec( LOANCHAIN_TESTING_GENESIS_TIMESTAMP );
         prices[loan_token] = 1;
         prices[collateral_token] = 2000;

         account_object keeper;
         keeper.id = object_id_type( keeper_id );
         keeper.name = "keeper";
         accounts["keeper"] = keeper;

         tokens.push_back( make_token( collateral_token, "ETH", 18 ) );
         tokens.push_back( make_token( loan_token, "USDC", 6 ) );
      }

      void connect() override
      {
         ++connect_attempts;
         if( connect_failures > 0 )
         {
            --connect_failures;
            FC_THROW_EXCEPTION( ledger_unavailable_exception, "connection refused" );
         }
         connected = true;
      }

      bool is_connected()const override { return connected; }

      time_point_sec get_head_time() override
      {
         check_connection();
         if( on_head_time )
            on_head_time();
         return head_time;
      }

      loan_id_type get_next_loan_id() override
      {
         check_connection();
         FC_ASSERT( !next_loan_id_broken, "next loan id is not available" );
         if( next_loan_id.valid() )
            return *next_loan_id;
         return loans.empty() ? loan_id_type( 0 ) : loan_id_type( loans.rbegin()->first + 1 );
      }

      optional<loan_object> get_loan( loan_id_type id ) override
      {
         check_connection();
         loan_reads.push_back( id.instance.value );
         if( drop_on_loan.valid() && *drop_on_loan == id.instance.value )
         {
            drop_on_loan.reset();
            connected = false;
            check_connection();
         }
         auto itr = loans.find( id.instance.value );
         if( itr == loans.end() )
            return optional<loan_object>();
         return itr->second;
      }

      usd_valuation get_usd_value( token_id_type token, const amount_type& raw_amount ) override
      {
         check_connection();
         if( unpriced.count( token ) > 0 )
            FC_THROW_EXCEPTION( stale_quote, "Price data too old" );
         usd_valuation v;
         v.value = raw_amount * prices.at( token );
         v.as_of = head_time;
         return v;
      }

      optional<account_object> get_account_by_name( const std::string& name ) override
      {
         check_connection();
         auto itr = accounts.find( name );
         if( itr == accounts.end() )
            return optional<account_object>();
         return itr->second;
      }

      uint32_t get_next_sequence( account_id_type account ) override
      {
         check_connection();
         return sequence;
      }

      vector<token_object> list_tokens() override
      {
         check_connection();
         return tokens;
      }

      amount_type get_balance( account_id_type account, token_id_type token ) override
      {
         check_connection();
         auto itr = balances.find( token );
         return itr == balances.end() ? amount_type( 0 ) : itr->second;
      }

      processed_transaction submit_and_wait( const transaction& trx, fc::microseconds timeout ) override
      {
         check_connection();
         submitted.push_back( trx );
         if( timeouts > 0 )
         {
            --timeouts;
            FC_THROW_EXCEPTION( settlement_timeout_exception, "no confirmation within ${t}", ("t",timeout) );
         }
         LOANCHAIN_ASSERT( trx.sequence == sequence, transaction_sequence_mismatch,
                           "expected sequence ${e}", ("e",sequence) );

         const auto& op = trx.operations.at( 0 ).get<loan_liquidate_operation>();
         FC_ASSERT( rejected.count( op.loan.instance.value ) == 0, "loan ${id} cannot be liquidated", ("id",op.loan) );
         loan_object& loan = loans.at( op.loan.instance.value );
         FC_ASSERT( !loan.is_terminal() );
         loan.status = loan_status::liquidated;

         // other transactions of the keeper may land in between
         sequence += 1 + sequence_gap;

         processed_transaction result( trx );
         result.applied_at = head_time;
         return result;
      }

      void add_loan( uint64_t instance, const loan_object& loan )
      {
         loan_object l = loan;
         l.id = object_id_type( loan_id_type( instance ) );
         loans[instance] = l;
      }

      bool                                   connected = true;
      uint32_t                               connect_failures = 0;
      uint32_t                               connect_attempts = 0;
      time_point_sec                         head_time;
      optional<loan_id_type>                 next_loan_id;
      bool                                   next_loan_id_broken = false;
      std::map<uint64_t, loan_object>        loans;
      std::map<token_id_type, amount_type>   prices;
      std::set<token_id_type>                unpriced;
      std::map<std::string, account_object>  accounts;
      vector<token_object>                   tokens;
      std::map<token_id_type, amount_type>   balances;
      uint32_t                               sequence = 0;
      uint32_t                               sequence_gap = 0;
      uint32_t                               timeouts = 0;
      std::set<uint64_t>                     rejected;
      optional<uint64_t>                     drop_on_loan;
      std::function<void()>                  on_head_time;

      std::vector<uint64_t>                  loan_reads;
      std::vector<transaction>               submitted;

   private:
      static token_object make_token( token_id_type id, const std::string& symbol, uint8_t decimals )
      {
         token_object token;
         token.id = object_id_type( id );
         token.symbol = symbol;
         token.decimals = decimals;
         return token;
      }

      void check_connection()const
      {
         if( !connected )
            FC_THROW_EXCEPTION( ledger_unavailable_exception, "not connected" );
      }
};

/// 1000 units lent against 1 unit of collateral worth 2000, due in 30 days
loan_object make_loan( loan_status status, const time_point_sec now )
{
   loan_object loan;
   loan.borrower = account_id_type( 3 );
   loan.loan_token = loan_token;
   loan.collateral_token = collateral_token;
   loan.principal = 1000;
   loan.collateral_amount = 1;
   loan.interest_rate_bps = 500;
   loan.status = status;
   loan.amount_funded = loan.principal;
   loan.funded_at = now;
   loan.due_date = now + 30 * 24 * 60 * 60;
   return loan;
}

loan_object under_collateralized_loan( const time_point_sec now )
{
   loan_object loan = make_loan( loan_status::active, now );
   loan.principal = 1700;
   loan.amount_funded = loan.principal;
   return loan;
}

monitor_options make_options( uint32_t scan_cap = 100 )
{
   monitor_options options;
   options.liquidator_account = "keeper";
   options.scan_cap = scan_cap;
   options.confirm_timeout = fc::seconds( 3 );
   options.reconnect_delay = fc::seconds( 5 );
   return options;
}

struct monitor_fixture
{
   std::shared_ptr<fake_ledger_client> ledger = std::make_shared<fake_ledger_client>();
   std::vector<fc::microseconds> sleeps;

   sleep_function recording_sleep()
   {
      return [this]( fc::microseconds d ) { sleeps.push_back( d ); };
   }

   std::unique_ptr<liquidation_monitor> make_monitor( uint32_t scan_cap = 100,
                                                      retry_policy retry = retry_policy::fixed( 3, fc::seconds( 1 ) ) )
   {
      return std::unique_ptr<liquidation_monitor>(
               new liquidation_monitor( ledger, make_options( scan_cap ), retry, recording_sleep() ) );
   }

   loan_id_type settled_loan( size_t i )const
   {
      return ledger->submitted.at( i ).operations.at( 0 ).get<loan_liquidate_operation>().loan;
   }
};

}

BOOST_FIXTURE_TEST_SUITE( liquidation_monitor_tests, monitor_fixture )

BOOST_AUTO_TEST_CASE( options_are_validated )
{
   monitor_options options = make_options();
   options.liquidator_account.clear();
   BOOST_CHECK_THROW( liquidation_monitor( ledger, options, retry_policy::fixed( 1, fc::seconds(0) ) ), fc::exception );

   options = make_options( 0 );
   BOOST_CHECK_THROW( liquidation_monitor( ledger, options, retry_policy::fixed( 1, fc::seconds(0) ) ), fc::exception );

   options = make_options();
   options.interval_seconds = 0;
   BOOST_CHECK_THROW( liquidation_monitor( ledger, options, retry_policy::fixed( 1, fc::seconds(0) ) ), fc::exception );

   BOOST_CHECK_THROW( liquidation_monitor( nullptr, make_options(), retry_policy::fixed( 1, fc::seconds(0) ) ),
                      fc::exception );
}

BOOST_AUTO_TEST_CASE( settles_each_liquidatable_loan_with_a_fresh_sequence )
{ try {
   const time_point_sec now = ledger->head_time;

   ledger->add_loan( 0, under_collateralized_loan( now ) );
   ledger->add_loan( 1, make_loan( loan_status::active, now ) );

   loan_object voted = make_loan( loan_status::voting, now - 31 * 24 * 60 * 60 );
   voted.voting_deadline = now + 60;
   voted.resolution = vote_choice::liquidate;
   ledger->add_loan( 2, voted );

   ledger->add_loan( 3, make_loan( loan_status::repaid, now ) );

   loan_object undecided = make_loan( loan_status::voting, now - 31 * 24 * 60 * 60 );
   undecided.voting_deadline = now + 60;
   ledger->add_loan( 4, undecided );

   ledger->add_loan( 5, under_collateralized_loan( now ) );

   ledger->sequence = 40;
   ledger->sequence_gap = 2;

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();

   BOOST_CHECK( !report.skipped );
   BOOST_CHECK( !report.disconnected );
   BOOST_CHECK( !report.deferred );
   BOOST_CHECK_EQUAL( report.scanned, 6u );
   BOOST_CHECK_EQUAL( report.liquidatable, 3u );
   BOOST_CHECK_EQUAL( report.settled, 3u );
   BOOST_CHECK_EQUAL( report.failed, 0u );
   BOOST_CHECK_EQUAL( report.time_only, 0u );

   BOOST_REQUIRE_EQUAL( ledger->submitted.size(), 3u );
   BOOST_CHECK( settled_loan( 0 ) == loan_id_type( 0 ) );
   BOOST_CHECK( settled_loan( 1 ) == loan_id_type( 2 ) );
   BOOST_CHECK( settled_loan( 2 ) == loan_id_type( 5 ) );
   BOOST_CHECK_EQUAL( ledger->submitted[0].sequence, 40u );
   BOOST_CHECK_EQUAL( ledger->submitted[1].sequence, 43u );
   BOOST_CHECK_EQUAL( ledger->submitted[2].sequence, 46u );
   for( const auto& trx : ledger->submitted )
   {
      BOOST_CHECK( trx.signer == keeper_id );
      BOOST_CHECK( trx.operations.at( 0 ).get<loan_liquidate_operation>().liquidator == keeper_id );
   }

   BOOST_TEST_MESSAGE( "Nothing is left to settle in the next cycle" );
   const cycle_report second = monitor->tick();
   BOOST_CHECK_EQUAL( second.scanned, 6u );
   BOOST_CHECK_EQUAL( second.liquidatable, 0u );
   BOOST_CHECK_EQUAL( ledger->submitted.size(), 3u );
   BOOST_CHECK( sleeps.empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unvalued_loans_are_judged_by_due_date )
{ try {
   const time_point_sec now = ledger->head_time;
   ledger->unpriced.insert( collateral_token );

   loan_object overdue = under_collateralized_loan( now - 31 * 24 * 60 * 60 );
   ledger->add_loan( 0, overdue );
   ledger->add_loan( 1, under_collateralized_loan( now ) );

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();

   BOOST_CHECK_EQUAL( report.scanned, 2u );
   BOOST_CHECK_EQUAL( report.time_only, 2u );
   BOOST_CHECK_EQUAL( report.liquidatable, 1u );
   BOOST_CHECK_EQUAL( report.settled, 1u );
   BOOST_REQUIRE_EQUAL( ledger->submitted.size(), 1u );
   BOOST_CHECK( settled_loan( 0 ) == loan_id_type( 0 ) );

   BOOST_TEST_MESSAGE( "Once prices are back the under-collateralized loan is settled" );
   ledger->unpriced.clear();
   const cycle_report second = monitor->tick();
   BOOST_CHECK_EQUAL( second.time_only, 0u );
   BOOST_CHECK_EQUAL( second.settled, 1u );
   BOOST_CHECK( settled_loan( 1 ) == loan_id_type( 1 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unconfirmed_settlement_defers_the_rest )
{ try {
   const time_point_sec now = ledger->head_time;
   for( uint64_t i = 0; i < 3; ++i )
      ledger->add_loan( i, under_collateralized_loan( now ) );
   ledger->timeouts = 1;

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();

   BOOST_CHECK( report.deferred );
   BOOST_CHECK_EQUAL( report.scanned, 3u );
   BOOST_CHECK_EQUAL( report.liquidatable, 3u );
   BOOST_CHECK_EQUAL( report.settled, 0u );
   BOOST_CHECK_EQUAL( report.failed, 1u );
   BOOST_CHECK_EQUAL( ledger->submitted.size(), 1u );

   const cycle_report second = monitor->tick();
   BOOST_CHECK( !second.deferred );
   BOOST_CHECK_EQUAL( second.settled, 3u );
   BOOST_REQUIRE_EQUAL( ledger->submitted.size(), 4u );
   BOOST_CHECK_EQUAL( ledger->submitted[1].sequence, 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rejected_settlement_does_not_stop_the_cycle )
{ try {
   const time_point_sec now = ledger->head_time;
   ledger->add_loan( 0, under_collateralized_loan( now ) );
   ledger->add_loan( 1, under_collateralized_loan( now ) );
   ledger->rejected.insert( 0 );

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();

   BOOST_CHECK_EQUAL( report.liquidatable, 2u );
   BOOST_CHECK_EQUAL( report.failed, 1u );
   BOOST_CHECK_EQUAL( report.settled, 1u );
   BOOST_CHECK( !report.deferred );
   BOOST_CHECK( ledger->loans.at( 1 ).status == loan_status::liquidated );
   BOOST_CHECK( ledger->loans.at( 0 ).status == loan_status::active );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reconnects_after_outage )
{ try {
   ledger->add_loan( 0, under_collateralized_loan( ledger->head_time ) );
   ledger->connected = false;
   ledger->connect_failures = 3;

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();

   BOOST_CHECK_EQUAL( ledger->connect_attempts, 4u );
   BOOST_REQUIRE_EQUAL( sleeps.size(), 3u );
   for( const auto& d : sleeps )
      BOOST_CHECK( d == fc::seconds( 5 ) );
   BOOST_CHECK( !report.disconnected );
   BOOST_CHECK_EQUAL( report.settled, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( read_reconnects_after_connection_loss )
{ try {
   const time_point_sec now = ledger->head_time;
   for( uint64_t i = 0; i < 3; ++i )
      ledger->add_loan( i, under_collateralized_loan( now ) );
   ledger->drop_on_loan = 1;

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();

   BOOST_TEST_MESSAGE( "The second attempt reconnects and reads loan 1" );
   BOOST_CHECK( !report.disconnected );
   BOOST_CHECK_EQUAL( report.scanned, 3u );
   BOOST_CHECK_EQUAL( report.settled, 3u );
   BOOST_CHECK_EQUAL( report.failed, 0u );
   BOOST_CHECK_EQUAL( ledger->connect_attempts, 1u );
   BOOST_REQUIRE_EQUAL( sleeps.size(), 1u );
   BOOST_CHECK( sleeps[0] == fc::seconds( 1 ) );
   BOOST_CHECK( ledger->loan_reads == std::vector<uint64_t>( { 0, 1, 1, 2 } ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( connection_lost_mid_cycle )
{ try {
   const time_point_sec now = ledger->head_time;
   for( uint64_t i = 0; i < 3; ++i )
      ledger->add_loan( i, under_collateralized_loan( now ) );
   ledger->drop_on_loan = 1;
   ledger->connect_failures = 2;

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();

   BOOST_CHECK( report.disconnected );
   BOOST_CHECK_EQUAL( report.scanned, 1u );
   BOOST_CHECK_EQUAL( report.settled, 1u );
   BOOST_CHECK_EQUAL( report.failed, 0u );
   BOOST_CHECK_EQUAL( ledger->connect_attempts, 2u );
   BOOST_CHECK_EQUAL( sleeps.size(), 2u );

   const cycle_report second = monitor->tick();
   BOOST_CHECK( !second.disconnected );
   BOOST_CHECK_EQUAL( second.scanned, 3u );
   BOOST_CHECK_EQUAL( second.settled, 2u );
   BOOST_CHECK_EQUAL( ledger->connect_attempts, 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( overlapping_tick_is_skipped )
{ try {
   ledger->add_loan( 0, under_collateralized_loan( ledger->head_time ) );
   auto monitor = make_monitor();

   optional<cycle_report> nested;
   bool busy = false;
   ledger->on_head_time = [&]() {
      if( nested.valid() )
         return;
      busy = monitor->cycle_in_progress();
      nested = monitor->tick();
   };

   const cycle_report report = monitor->tick();
   BOOST_CHECK( busy );
   BOOST_REQUIRE( nested.valid() );
   BOOST_CHECK( nested->skipped );
   BOOST_CHECK_EQUAL( nested->scanned, 0u );
   BOOST_CHECK( !report.skipped );
   BOOST_CHECK_EQUAL( report.settled, 1u );
   BOOST_CHECK( !monitor->cycle_in_progress() );
   BOOST_CHECK_EQUAL( ledger->submitted.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( scan_ends_at_first_missing_loan )
{ try {
   const time_point_sec now = ledger->head_time;
   ledger->add_loan( 0, make_loan( loan_status::active, now ) );
   ledger->add_loan( 1, make_loan( loan_status::active, now ) );
   ledger->add_loan( 3, under_collateralized_loan( now ) );
   ledger->next_loan_id = loan_id_type( 10 );

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();
   BOOST_CHECK_EQUAL( report.scanned, 2u );
   BOOST_CHECK_EQUAL( report.settled, 0u );
   BOOST_CHECK( ledger->loan_reads == std::vector<uint64_t>( { 0, 1, 2 } ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( missing_first_loan_is_skipped )
{ try {
   const time_point_sec now = ledger->head_time;
   ledger->add_loan( 1, under_collateralized_loan( now ) );
   ledger->add_loan( 2, make_loan( loan_status::active, now ) );

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();
   BOOST_CHECK_EQUAL( report.scanned, 2u );
   BOOST_CHECK_EQUAL( report.settled, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( scan_covers_loans_beyond_the_cap )
{ try {
   const time_point_sec now = ledger->head_time;
   for( uint64_t i = 0; i < 150; ++i )
      ledger->add_loan( i, make_loan( loan_status::active, now ) );
   ledger->add_loan( 120, under_collateralized_loan( now ) );
   ledger->next_loan_id = loan_id_type( 150 );

   auto monitor = make_monitor( 100 );
   const cycle_report report = monitor->tick();
   BOOST_CHECK_EQUAL( report.scanned, 150u );
   BOOST_CHECK_EQUAL( report.liquidatable, 1u );
   BOOST_CHECK_EQUAL( report.settled, 1u );
   BOOST_REQUIRE_EQUAL( ledger->submitted.size(), 1u );
   BOOST_CHECK( settled_loan( 0 ) == loan_id_type( 120 ) );
   BOOST_CHECK( ledger->loans.at( 120 ).status == loan_status::liquidated );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cap_bounds_the_scan_without_loan_count )
{ try {
   const time_point_sec now = ledger->head_time;
   for( uint64_t i = 0; i < 10; ++i )
      ledger->add_loan( i, make_loan( loan_status::active, now ) );
   ledger->next_loan_id_broken = true;

   auto monitor = make_monitor( 4 );
   BOOST_CHECK_EQUAL( monitor->tick().scanned, 4u );
   BOOST_CHECK_EQUAL( ledger->loan_reads.size(), 4u );

   BOOST_TEST_MESSAGE( "A cap above the loan count ends at the first missing loan" );
   auto wide = make_monitor( 50 );
   BOOST_CHECK_EQUAL( wide->tick().scanned, 10u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unknown_liquidator_account_fails_the_cycle )
{ try {
   ledger->add_loan( 0, under_collateralized_loan( ledger->head_time ) );
   ledger->accounts.clear();

   auto monitor = make_monitor();
   const cycle_report report = monitor->tick();
   BOOST_CHECK_EQUAL( report.failed, 1u );
   BOOST_CHECK_EQUAL( report.scanned, 0u );
   BOOST_CHECK( ledger->submitted.empty() );
   BOOST_CHECK( !monitor->cycle_in_progress() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( health_check_reports_balances )
{ try {
   ledger->balances[loan_token] = amount_type( 500 ) * pow10( 6 );
   ledger->balances[collateral_token] = pow10( 17 );

   monitor_options options = make_options();
   options.low_balance_thresholds["USDC"] = 100;
   liquidation_monitor monitor( ledger, options, retry_policy::fixed( 1, fc::seconds( 0 ) ), recording_sleep() );

   health_report health = monitor.health_check();
   BOOST_CHECK( health.healthy );
   BOOST_CHECK( health.connected );
   BOOST_CHECK( !health.running );
   BOOST_CHECK( !health.last_cycle.valid() );
   BOOST_CHECK( !health.error.valid() );
   BOOST_REQUIRE( health.head_time.valid() );
   BOOST_CHECK( *health.head_time == ledger->head_time );
   BOOST_REQUIRE_EQUAL( health.balances.size(), 2u );
   BOOST_CHECK_EQUAL( health.balances[0].symbol, "ETH" );
   BOOST_CHECK( health.balances[0].balance == pow10( 17 ) );
   BOOST_CHECK( !health.balances[0].low );
   BOOST_CHECK_EQUAL( health.balances[1].symbol, "USDC" );
   BOOST_CHECK( !health.balances[1].low );

   BOOST_TEST_MESSAGE( "Falling below the threshold is reported" );
   ledger->balances[loan_token] = amount_type( 100 ) * pow10( 6 ) - 1;
   health = monitor.health_check();
   BOOST_CHECK( !health.healthy );
   BOOST_CHECK( health.connected );
   BOOST_REQUIRE_EQUAL( health.balances.size(), 2u );
   BOOST_CHECK( health.balances[1].low );

   BOOST_TEST_MESSAGE( "Inactive tokens are not checked" );
   ledger->tokens[1].active = false;
   health = monitor.health_check();
   BOOST_CHECK( health.healthy );
   BOOST_CHECK_EQUAL( health.balances.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( health_check_reports_connection_and_last_cycle )
{ try {
   ledger->add_loan( 0, under_collateralized_loan( ledger->head_time ) );
   auto monitor = make_monitor();

   monitor->tick();
   health_report health = monitor->health_check();
   BOOST_CHECK( health.healthy );
   BOOST_REQUIRE( health.last_cycle.valid() );
   BOOST_CHECK_EQUAL( health.last_cycle->settled, 1u );
   BOOST_CHECK( !health.cycle_in_progress );

   BOOST_TEST_MESSAGE( "A lost connection is reported without reconnecting" );
   ledger->connected = false;
   health = monitor->health_check();
   BOOST_CHECK( !health.healthy );
   BOOST_CHECK( !health.connected );
   BOOST_CHECK( !health.head_time.valid() );
   BOOST_CHECK_EQUAL( ledger->connect_attempts, 0u );

   BOOST_TEST_MESSAGE( "An unknown liquidator account is an error" );
   ledger->connected = true;
   ledger->accounts.clear();
   health = monitor->health_check();
   BOOST_CHECK( !health.healthy );
   BOOST_CHECK( health.connected );
   BOOST_CHECK( health.error.valid() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( health_check_runs_during_a_cycle )
{ try {
   ledger->add_loan( 0, under_collateralized_loan( ledger->head_time ) );
   auto monitor = make_monitor();

   optional<health_report> during;
   bool checked = false;
   ledger->on_head_time = [&]() {
      if( checked )
         return;
      checked = true;
      during = monitor->health_check();
   };
   monitor->tick();

   BOOST_REQUIRE( during.valid() );
   BOOST_CHECK( during->cycle_in_progress );
   BOOST_CHECK( during->connected );
   BOOST_CHECK_EQUAL( ledger->submitted.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unanswered_read_times_out )
{ try {
   fc::promise<int>::ptr answer = fc::promise<int>::create( "answer" );
   BOOST_CHECK_THROW( call_with_timeout( "get_loan", fc::milliseconds( 20 ), [answer]() {
                         return fc::future<int>( answer ).wait();
                      } ), ledger_unavailable_exception );
   answer->set_value( 7 );

   BOOST_CHECK_EQUAL( call_with_timeout( "get_head_time", fc::seconds( 5 ), []() { return 3; } ), 3 );
   BOOST_CHECK_THROW( call_with_timeout( "get_loan", fc::seconds( 5 ), []() -> int {
                         FC_THROW_EXCEPTION( fc::assert_exception, "rejected by the ledger" );
                      } ), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE( liquidation_monitor_ledger_tests, database_fixture )

BOOST_AUTO_TEST_CASE( monitor_settles_on_the_ledger )
{ try {
   ACTORS( (borrower)(alice)(keeper) );
   fund( borrower_id, eth_id, eth(2) );
   fund( alice_id, usdc_id, usdc(2000) );
   fund( keeper_id, usdc_id, usdc(5000) );

   const loan_id_type risky = request_loan( borrower_id, usdc(1000), eth(1) ).get_id();
   const loan_id_type healthy = request_loan( borrower_id, usdc(500), eth(1) ).get_id();
   contribute( alice_id, risky, usdc(1000) );
   contribute( alice_id, healthy, usdc(500) );

   monitor_options options;
   options.liquidator_account = "keeper";
   liquidation_monitor monitor( std::make_shared<database_ledger_client>( db ), options,
                                retry_policy::fixed( 1, fc::microseconds( 0 ) ),
                                []( fc::microseconds ) {} );

   cycle_report report = monitor.tick();
   BOOST_CHECK_EQUAL( report.scanned, 2u );
   BOOST_CHECK_EQUAL( report.liquidatable, 0u );

   BOOST_TEST_MESSAGE( "At 1100 USD per ETH only the larger loan is under-collateralized" );
   publish_feed( "ETH/USD", amount_type(1100) * pow10(8) );
   report = monitor.tick();
   BOOST_CHECK_EQUAL( report.liquidatable, 1u );
   BOOST_CHECK_EQUAL( report.settled, 1u );
   BOOST_CHECK_EQUAL( report.failed, 0u );

   BOOST_CHECK( db.get_loan( risky ).status == loan_status::liquidated );
   BOOST_CHECK( db.get_loan( healthy ).status == loan_status::active );
   BOOST_CHECK( get_balance( keeper_id, eth_id ) == eth(1) );
   BOOST_CHECK( get_balance( keeper_id, usdc_id ) == usdc(5000 - 1050) );
   BOOST_CHECK_EQUAL( db.get_account( keeper_id ).next_sequence, 1u );
   verify_token_supplies();

   report = monitor.tick();
   BOOST_CHECK_EQUAL( report.liquidatable, 0u );
   BOOST_CHECK_EQUAL( report.settled, 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( monitor_settles_after_voting_times_out )
{ try {
   ACTORS( (borrower)(alice)(keeper) );
   fund( borrower_id, eth_id, eth(1) );
   fund( alice_id, usdc_id, usdc(1000) );
   fund( keeper_id, usdc_id, usdc(5000) );

   const loan_id_type loan_id = request_loan( borrower_id, usdc(1000), eth(1) ).get_id();
   contribute( alice_id, loan_id, usdc(1000) );

   monitor_options options;
   options.liquidator_account = "keeper";
   liquidation_monitor monitor( std::make_shared<database_ledger_client>( db ), options,
                                retry_policy::fixed( 1, fc::microseconds( 0 ) ),
                                []( fc::microseconds ) {} );

   advance_time( 30 * 24 * 60 * 60 + 1 );
   BOOST_CHECK( db.get_loan( loan_id ).status == loan_status::voting );

   BOOST_TEST_MESSAGE( "While the vote is open the loan is left to the lenders" );
   cycle_report report = monitor.tick();
   BOOST_CHECK_EQUAL( report.scanned, 1u );
   BOOST_CHECK_EQUAL( report.liquidatable, 0u );

   advance_time( LOANCHAIN_DEFAULT_VOTING_PERIOD + 1 );
   report = monitor.tick();
   BOOST_CHECK_EQUAL( report.time_only, 1u );
   BOOST_CHECK_EQUAL( report.liquidatable, 1u );
   BOOST_CHECK_EQUAL( report.settled, 1u );
   BOOST_CHECK( db.get_loan( loan_id ).status == loan_status::liquidated );
   BOOST_CHECK( get_balance( keeper_id, eth_id ) == eth(1) );
   BOOST_CHECK( get_balance( alice_id, usdc_id ) == usdc(1050) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
