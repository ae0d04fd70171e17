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

#include <loanchain/chain/database.hpp>
#include <loanchain/chain/exceptions.hpp>
#include <loanchain/chain/valuation.hpp>

#include "../common/database_fixture.hpp"

using namespace loanchain::chain;
using namespace loanchain::chain::test;

namespace {

token_object make_token( uint8_t decimals, const string& feed )
{
   token_object t;
   t.symbol = "TEST";
   t.decimals = decimals;
   t.price_feed = feed;
   return t;
}

price_quote make_quote( const amount_type& price, uint8_t decimals, time_point_sec updated_at = time_point_sec() )
{
   price_quote q;
   q.price = price;
   q.decimals = decimals;
   q.updated_at = updated_at;
   return q;
}

}

BOOST_FIXTURE_TEST_SUITE( valuation_tests, database_fixture )

BOOST_AUTO_TEST_CASE( usd_value_normalizes_decimals )
{ try {
   const amount_type one_usd = pow10( LOANCHAIN_USD_DECIMALS );

   BOOST_CHECK( to_usd_value( usdc(1000), 6, make_quote( USDC_USD_PRICE, 8 ) ) == one_usd * 1000 );
   BOOST_CHECK( to_usd_value( eth(1), 18, make_quote( ETH_USD_PRICE, 8 ) ) == one_usd * 2000 );
   BOOST_CHECK( to_usd_value( eth(1) / 2, 18, make_quote( ETH_USD_PRICE, 8 ) ) == one_usd * 1000 );

   BOOST_TEST_MESSAGE( "The precision of the quote does not change the value" );
   BOOST_CHECK( to_usd_value( eth(3), 18, make_quote( amount_type(2000) * pow10(18), 18 ) ) == one_usd * 6000 );
   BOOST_CHECK( to_usd_value( eth(3), 18, make_quote( amount_type(2000), 0 ) ) == one_usd * 6000 );

   BOOST_TEST_MESSAGE( "Values are rounded down" );
   BOOST_CHECK( to_usd_value( amount_type(1), 18, make_quote( ETH_USD_PRICE, 8 ) ) == 0 );
   BOOST_CHECK( to_usd_value( amount_type(1), 6, make_quote( amount_type(15), 1 ) ) == 150 );
   BOOST_CHECK( to_usd_value( amount_type(333), 3, make_quote( amount_type(1), 0 ) ) == amount_type(33300000) );
   BOOST_CHECK( to_usd_value( amount_type(1), 9, make_quote( amount_type(1), 0 ) ) == 0 );

   BOOST_TEST_MESSAGE( "Tokens without decimals" );
   BOOST_CHECK( to_usd_value( amount_type(7), 0, make_quote( amount_type(3), 0 ) ) == one_usd * 21 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( usd_value_of_large_amounts )
{ try {
   BOOST_TEST_MESSAGE( "The largest amount is valued exactly" );
   const amount_type value = to_usd_value( max_amount(), 18, make_quote( pow10( 18 ), 18 ) );
   BOOST_CHECK( value == max_amount() / pow10( 10 ) );

   BOOST_TEST_MESSAGE( "Results which do not fit into an amount are rejected" );
   BOOST_CHECK_THROW( to_usd_value( max_amount(), 0, make_quote( amount_type(2), 0 ) ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( stale_quotes_are_rejected )
{ try {
   test_price_oracle oracle;
   valuation_engine engine( oracle, LOANCHAIN_DEFAULT_MAX_QUOTE_AGE );
   const token_object token = make_token( 6, "USDC/USD" );
   const time_point_sec now( LOANCHAIN_TESTING_GENESIS_TIMESTAMP + 100000 );

   oracle.set_quote( "USDC/USD", USDC_USD_PRICE, 8, now - LOANCHAIN_DEFAULT_MAX_QUOTE_AGE );
   usd_valuation v = engine.usd_value( token, usdc(5), now );
   BOOST_CHECK( v.value == pow10( LOANCHAIN_USD_DECIMALS ) * 5 );
   BOOST_CHECK( v.as_of == now - LOANCHAIN_DEFAULT_MAX_QUOTE_AGE );

   oracle.set_quote( "USDC/USD", USDC_USD_PRICE, 8, now - ( LOANCHAIN_DEFAULT_MAX_QUOTE_AGE + 1 ) );
   LOANCHAIN_CHECK_THROW( engine.usd_value( token, usdc(5), now ), stale_quote );

   BOOST_TEST_MESSAGE( "A quote observed after the valuation time is fresh" );
   oracle.set_quote( "USDC/USD", USDC_USD_PRICE, 8, now + 10 );
   BOOST_CHECK( engine.usd_value( token, usdc(5), now ).value == pow10( LOANCHAIN_USD_DECIMALS ) * 5 );

   BOOST_TEST_MESSAGE( "A shorter maximum age applies" );
   valuation_engine strict( oracle, 60 );
   oracle.set_quote( "USDC/USD", USDC_USD_PRICE, 8, now - 61 );
   LOANCHAIN_CHECK_THROW( strict.usd_value( token, usdc(5), now ), stale_quote );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( oracle_failures_become_stale_quotes )
{ try {
   test_price_oracle oracle;
   valuation_engine engine( oracle, LOANCHAIN_DEFAULT_MAX_QUOTE_AGE );
   const token_object token = make_token( 18, "ETH/USD" );
   const time_point_sec now = db.head_time();

   LOANCHAIN_CHECK_THROW( engine.usd_value( token, eth(1), now ), stale_quote );

   oracle.set_quote( "ETH/USD", ETH_USD_PRICE, 8, now );
   oracle.fail( "ETH/USD" );
   LOANCHAIN_CHECK_THROW( engine.usd_value( token, eth(1), now ), stale_quote );

   oracle.recover( "ETH/USD" );
   BOOST_CHECK( engine.usd_value( token, eth(1), now ).value == pow10( LOANCHAIN_USD_DECIMALS ) * 2000 );
   BOOST_CHECK_EQUAL( oracle.lookups, 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( ledger_feeds_expire )
{ try {
   const token_object& eth_token = db.get_token( eth_id );
   BOOST_CHECK( db.get_usd_value( eth_token, eth(2) ).value == pow10( LOANCHAIN_USD_DECIMALS ) * 4000 );

   advance_time( LOANCHAIN_DEFAULT_MAX_QUOTE_AGE + 1 );
   LOANCHAIN_CHECK_THROW( db.get_usd_value( eth_token, eth(2) ), stale_quote );

   refresh_feeds();
   BOOST_CHECK( db.get_usd_value( eth_token, eth(2) ).value == pow10( LOANCHAIN_USD_DECIMALS ) * 4000 );

   BOOST_TEST_MESSAGE( "A token whose feed was never published cannot be valued" );
   const token_object& dai = register_token( "DAI", token_kind::fungible, 18, "DAI/USD" );
   LOANCHAIN_CHECK_THROW( db.get_usd_value( dai, units( 1, 18 ) ), stale_quote );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( loan_requests_need_fresh_collateral_value )
{ try {
   ACTORS( (borrower) );
   fund( borrower_id, eth_id, eth(10) );

   BOOST_TEST_MESSAGE( "1.4 ETH at 2000 USD covers 280% of a 1000 USDC loan" );
   request_loan( borrower_id, usdc(1000), eth(14) / 10 );

   BOOST_TEST_MESSAGE( "0.7 ETH covers only 140%" );
   LOANCHAIN_REQUIRE_THROW( request_loan( borrower_id, usdc(1000), eth(7) / 10 ),
                            loan_request_insufficient_collateral );

   BOOST_TEST_MESSAGE( "Exactly 150% is enough" );
   request_loan( borrower_id, usdc(1000), eth(3) / 4 );

   advance_time( LOANCHAIN_DEFAULT_MAX_QUOTE_AGE + 1 );
   LOANCHAIN_REQUIRE_THROW( request_loan( borrower_id, usdc(1000), eth(1) ), stale_quote );

   refresh_feeds();
   request_loan( borrower_id, usdc(1000), eth(1) );

   loan_request_operation op = make_loan_request( borrower_id, usdc(1000), eth(1) );
   op.interest_rate_bps = LOANCHAIN_DEFAULT_MAX_INTEREST_RATE_BPS + 1;
   LOANCHAIN_REQUIRE_THROW( request_loan( op ), loan_request_interest_rate_too_high );

   op.interest_rate_bps = 0;
   op.collateral_amount = eth(100);
   LOANCHAIN_REQUIRE_THROW( request_loan( op ), insufficient_balance );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( replaced_oracle_is_used_by_the_ledger )
{ try {
   auto oracle = std::make_shared<test_price_oracle>();
   oracle->set_quote( "ETH/USD", amount_type(1000) * pow10(8), 8, db.head_time() );
   oracle->set_quote( "USDC/USD", USDC_USD_PRICE, 8, db.head_time() );
   db.set_price_oracle( oracle );

   ACTORS( (borrower) );
   fund( borrower_id, eth_id, eth(10) );

   BOOST_TEST_MESSAGE( "At 1000 USD per ETH one ETH no longer covers 150% of 1000 USDC" );
   LOANCHAIN_REQUIRE_THROW( request_loan( borrower_id, usdc(1000), eth(1) ),
                            loan_request_insufficient_collateral );
   request_loan( borrower_id, usdc(1000), eth(2) );
   BOOST_CHECK_GT( oracle->lookups, 0u );

   oracle->fail( "ETH/USD" );
   LOANCHAIN_REQUIRE_THROW( request_loan( borrower_id, usdc(1000), eth(2) ), stale_quote );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
