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

#include "../common/database_fixture.hpp"

using namespace loanchain::chain;
using namespace loanchain::chain::test;

BOOST_FIXTURE_TEST_SUITE( token_registry_tests, database_fixture )

BOOST_AUTO_TEST_CASE( genesis_tokens )
{ try {
   const token_object& eth = db.get_token( eth_id );
   BOOST_CHECK( eth.kind == token_kind::native );
   BOOST_CHECK_EQUAL( eth.decimals, 18u );
   BOOST_CHECK( eth.asset_ref.empty() );
   BOOST_CHECK( eth.active );
   BOOST_CHECK_EQUAL( eth_id.instance.value, 0u );

   const token_object& usdc = db.get_token( usdc_id );
   BOOST_CHECK( usdc.kind == token_kind::fungible );
   BOOST_CHECK_EQUAL( usdc.decimals, 6u );
   BOOST_CHECK_EQUAL( usdc.price_feed, "USDC/USD" );

   BOOST_CHECK_EQUAL( eth.get_transfer_strategy().which(), transfer_strategy::tag<native_transfer>::value );
   BOOST_CHECK_EQUAL( usdc.get_transfer_strategy().which(), transfer_strategy::tag<fungible_transfer>::value );
   BOOST_CHECK_EQUAL( usdc.get_transfer_strategy().get<fungible_transfer>().asset_ref, usdc.asset_ref );

   LOANCHAIN_CHECK_THROW( db.get_token( token_id_type( 99 ) ), unknown_token );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( register_and_deactivate )
{ try {
   const token_object& dai = register_token( "DAI", token_kind::fungible, 18, "DAI/USD" );
   const token_id_type dai_id = dai.get_id();
   BOOST_CHECK( dai.active );
   BOOST_CHECK_EQUAL( dai.symbol, "DAI" );
   BOOST_CHECK( db.find_active_token( "DAI" ) == &dai );

   BOOST_TEST_MESSAGE( "A symbol can only be active once" );
   LOANCHAIN_REQUIRE_THROW( register_token( "DAI", token_kind::fungible, 6, "DAI/USD" ),
                            token_register_duplicate_symbol );

   deactivate_token( dai_id );
   BOOST_CHECK( !db.get_token( dai_id ).active );
   BOOST_CHECK( db.find_active_token( "DAI" ) == nullptr );

   BOOST_TEST_MESSAGE( "Deactivating twice changes nothing" );
   deactivate_token( dai_id );
   BOOST_CHECK( !db.get_token( dai_id ).active );

   BOOST_TEST_MESSAGE( "An inactive symbol may be registered again under a new id" );
   const token_object& dai2 = register_token( "DAI", token_kind::fungible, 18, "DAI/USD" );
   BOOST_CHECK( dai2.get_id() != dai_id );
   BOOST_CHECK( db.find_active_token( "DAI" ) == &dai2 );
   BOOST_CHECK( !db.get_token( dai_id ).active );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( register_requires_admin )
{ try {
   ACTORS( (mallory) );

   token_register_operation op;
   op.admin = mallory_id;
   op.kind = token_kind::fungible;
   op.asset_ref = "0xdead";
   op.symbol = "FAKE";
   op.decimals = 6;
   op.price_feed = "FAKE/USD";
   LOANCHAIN_REQUIRE_THROW( push_op( mallory_id, op ), token_register_unauthorized );
   BOOST_CHECK( db.find_active_token( "FAKE" ) == nullptr );

   token_deactivate_operation dop;
   dop.admin = mallory_id;
   dop.token = usdc_id;
   LOANCHAIN_REQUIRE_THROW( push_op( mallory_id, dop ), token_deactivate_unauthorized );
   BOOST_CHECK( db.get_token( usdc_id ).active );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( single_active_native_token )
{ try {
   LOANCHAIN_REQUIRE_THROW( register_token( "WETH", token_kind::native, 18, "ETH/USD" ),
                            token_register_duplicate_native );

   deactivate_token( eth_id );
   const token_object& native = register_token( "ETH2", token_kind::native, 18, "ETH/USD" );
   BOOST_CHECK( native.kind == token_kind::native );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( register_validation )
{ try {
   token_register_operation op;
   op.admin = admin_id;
   op.kind = token_kind::fungible;
   op.asset_ref = "0xbeef";
   op.symbol = "GOOD";
   op.decimals = 6;
   op.price_feed = "GOOD/USD";
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, symbol, "" );
   REQUIRE_OP_VALIDATION_FAILURE( op, symbol, "lower" );
   REQUIRE_OP_VALIDATION_FAILURE( op, symbol, "1ABC" );
   REQUIRE_OP_VALIDATION_FAILURE( op, symbol, "WAYTOOLONGSYMBOLNAME" );
   REQUIRE_OP_VALIDATION_FAILURE( op, decimals, 19 );
   REQUIRE_OP_VALIDATION_FAILURE( op, asset_ref, "" );
   REQUIRE_OP_VALIDATION_FAILURE( op, price_feed, "" );

   op.kind = token_kind::native;
   BOOST_CHECK_THROW( op.validate(), fc::exception );
   op.asset_ref.clear();
   op.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( inactive_token_blocks_new_loans_only )
{ try {
   ACTORS( (borrower)(lender) );
   fund( borrower_id, eth_id, eth(10) );
   fund( lender_id, usdc_id, usdc(5000) );

   const loan_id_type existing = request_loan( borrower_id, usdc(1000), eth(1) ).get_id();

   deactivate_token( usdc_id );

   LOANCHAIN_REQUIRE_THROW( request_loan( borrower_id, usdc(1000), eth(1) ), loan_request_token_inactive );

   BOOST_TEST_MESSAGE( "The loan requested before deactivation is still funded and disbursed" );
   contribute( lender_id, existing, usdc(1000) );
   BOOST_CHECK( db.get_loan( existing ).status == loan_status::active );
   BOOST_CHECK( get_balance( borrower_id, usdc_id ) == usdc(1000) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfers_follow_token_kind )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, eth_id, eth(3) );
   fund( alice_id, usdc_id, usdc(100) );

   transfer_operation op;
   op.from = alice_id;
   op.to = bob_id;
   op.token = eth_id;
   op.amount = eth(1);
   push_op( alice_id, op );

   op.token = usdc_id;
   op.amount = usdc(40);
   push_op( alice_id, op );

   BOOST_CHECK( db.get_account( alice_id ).native_balance == eth(2) );
   BOOST_CHECK( db.get_account( bob_id ).native_balance == eth(1) );
   BOOST_CHECK( get_balance( alice_id, usdc_id ) == usdc(60) );
   BOOST_CHECK( get_balance( bob_id, usdc_id ) == usdc(40) );

   op.amount = usdc(61);
   LOANCHAIN_REQUIRE_THROW( push_op( alice_id, op ), insufficient_balance );
   BOOST_CHECK( get_balance( alice_id, usdc_id ) == usdc(60) );

   BOOST_TEST_MESSAGE( "Every operation must act on behalf of the signer" );
   op.amount = usdc(1);
   transaction trx;
   trx.signer = bob_id;
   trx.sequence = db.get_account( bob_id ).next_sequence;
   trx.operations.push_back( op );
   LOANCHAIN_REQUIRE_THROW( PUSH_TX( db, trx ), tx_signer_mismatch );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( price_feed_publishing )
{ try {
   ACTORS( (oracle)(mallory) );

   price_feed_publish_operation op;
   op.publisher = mallory_id;
   op.feed = "ETH/USD";
   op.price = amount_type( 1 );
   op.decimals = 8;
   op.updated_at = db.head_time();
   LOANCHAIN_REQUIRE_THROW( push_op( mallory_id, op ), price_feed_publish_unauthorized );

   BOOST_TEST_MESSAGE( "Quotes from the future are rejected" );
   op.publisher = admin_id;
   op.updated_at = db.head_time() + 60;
   LOANCHAIN_REQUIRE_THROW( push_op( admin_id, op ), price_feed_publish_future_quote );

   advance_time( 600 );
   publish_feed( "ETH/USD", amount_type( 1500 ) * pow10( 8 ) );
   const price_feed_object* feed = db.find_price_feed( "ETH/USD" );
   BOOST_REQUIRE( feed != nullptr );
   BOOST_CHECK( feed->price == amount_type( 1500 ) * pow10( 8 ) );
   BOOST_CHECK( feed->updated_at == db.head_time() );
   BOOST_CHECK( feed->publisher == admin_id );

   publish_feed( "BTC/USD", amount_type( 60000 ) * pow10( 8 ) );
   BOOST_CHECK( db.find_price_feed( "BTC/USD" ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( older_quote_does_not_replace_newer_one )
{ try {
   advance_time( 600 );
   publish_feed( "ETH/USD", amount_type( 1500 ) * pow10( 8 ) );
   const time_point_sec published = db.head_time();

   advance_time( 600 );
   price_feed_publish_operation op;
   op.publisher = admin_id;
   op.feed = "ETH/USD";
   op.price = amount_type( 1400 ) * pow10( 8 );
   op.decimals = 8;
   op.updated_at = published - 1;
   LOANCHAIN_REQUIRE_THROW( push_op( admin_id, op ), price_feed_publish_outdated_quote );

   const price_feed_object* feed = db.find_price_feed( "ETH/USD" );
   BOOST_REQUIRE( feed != nullptr );
   BOOST_CHECK( feed->price == amount_type( 1500 ) * pow10( 8 ) );
   BOOST_CHECK( feed->updated_at == published );

   BOOST_TEST_MESSAGE( "A quote with the same time replaces the current one" );
   op.updated_at = published;
   push_op( admin_id, op );
   BOOST_CHECK( db.find_price_feed( "ETH/USD" )->price == amount_type( 1400 ) * pow10( 8 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
