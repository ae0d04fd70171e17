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

#include <loanchain/chain/liquidation.hpp>
#include <loanchain/chain/loan_accounting.hpp>

#include "../common/database_fixture.hpp"

#include <cstdlib>

using namespace loanchain::chain;
using namespace loanchain::chain::test;

namespace {

const time_point_sec due( LOANCHAIN_TESTING_GENESIS_TIMESTAMP + 30 * 24 * 60 * 60 );

loan_object make_active_loan()
{
   loan_object loan;
   loan.principal = usdc(1000);
   loan.collateral_amount = eth(1);
   loan.status = loan_status::active;
   loan.funded_at = due - 30 * 24 * 60 * 60;
   loan.due_date = due;
   return loan;
}

amount_type random_value()
{
   return amount_type( std::rand() ) * pow10( std::rand() % 20 );
}

}

BOOST_AUTO_TEST_SUITE( liquidation_tests )

BOOST_AUTO_TEST_CASE( threshold_is_exclusive )
{
   const amount_type loan_value = 1000;
   BOOST_CHECK( !is_under_collateralized( loan_value, 1200 ) );
   BOOST_CHECK( is_under_collateralized( loan_value, 1199 ) );
   BOOST_CHECK( !is_under_collateralized( loan_value, 5000 ) );
   BOOST_CHECK( is_under_collateralized( loan_value, 0 ) );
   BOOST_CHECK( !is_under_collateralized( 0, 0 ) );

   BOOST_TEST_MESSAGE( "Extreme values do not overflow" );
   BOOST_CHECK( !is_under_collateralized( max_amount(), max_amount() ) );
   BOOST_CHECK( is_under_collateralized( max_amount(), max_amount() / 2 ) );
}

BOOST_AUTO_TEST_CASE( past_due_is_strict )
{
   const loan_object loan = make_active_loan();
   BOOST_CHECK( !loan.is_past_due( due - 1 ) );
   BOOST_CHECK( !loan.is_past_due( due ) );
   BOOST_CHECK( loan.is_past_due( due + 1 ) );

   BOOST_TEST_MESSAGE( "A loan without due date is never past due" );
   loan_object unfunded;
   unfunded.status = loan_status::requested;
   BOOST_CHECK( !unfunded.is_past_due( due + 1000000 ) );
}

BOOST_AUTO_TEST_CASE( liquidatable_when_past_due_or_under_collateralized )
{
   const loan_object loan = make_active_loan();

   BOOST_CHECK( !is_liquidatable( loan, 1000, 1500, due ) );
   BOOST_CHECK( is_liquidatable( loan, 1000, 1100, due ) );
   BOOST_CHECK( is_liquidatable( loan, 1000, 1500, due + 1 ) );
   BOOST_CHECK( is_liquidatable( loan, 1000, 1100, due + 1 ) );

   liquidation_verdict v = evaluate_liquidation( loan, amount_type(1000), amount_type(1100), due );
   BOOST_CHECK( v.liquidatable );
   BOOST_CHECK( v.under_collateralized );
   BOOST_CHECK( !v.past_due );
   BOOST_CHECK( v.valued );

   v = evaluate_liquidation( loan, amount_type(1000), amount_type(1500), due + 1 );
   BOOST_CHECK( v.liquidatable );
   BOOST_CHECK( !v.under_collateralized );
   BOOST_CHECK( v.past_due );
}

BOOST_AUTO_TEST_CASE( missing_values_fall_back_to_due_date )
{
   const loan_object loan = make_active_loan();
   const optional<amount_type> none;

   liquidation_verdict v = evaluate_liquidation( loan, none, amount_type(1), due );
   BOOST_CHECK( !v.valued );
   BOOST_CHECK( !v.under_collateralized );
   BOOST_CHECK( !v.liquidatable );

   v = evaluate_liquidation( loan, amount_type(1000), none, due + 1 );
   BOOST_CHECK( !v.valued );
   BOOST_CHECK( v.past_due );
   BOOST_CHECK( v.liquidatable );

   v = evaluate_liquidation( loan, none, none, due + 1 );
   BOOST_CHECK( v.liquidatable );
}

BOOST_AUTO_TEST_CASE( verdict_matches_decision_rule )
{
   const loan_object loan = make_active_loan();
   for( int i = 0; i < 2000; ++i )
   {
      const amount_type loan_value = random_value();
      const amount_type collateral_value = random_value();
      const time_point_sec now = due + ( std::rand() % 3 ) - 1;

      const bool expected = now > due
                            || wide_amount_type( collateral_value ) * 100 < wide_amount_type( loan_value ) * 120;
      BOOST_CHECK_EQUAL( is_liquidatable( loan, loan_value, collateral_value, now ), expected );

      const auto verdict = evaluate_liquidation( loan, loan_value, collateral_value, now );
      BOOST_CHECK_EQUAL( verdict.liquidatable, expected );

      // without a value a past due loan is never reported safe
      const auto partial = evaluate_liquidation( loan, optional<amount_type>(), collateral_value, now );
      BOOST_CHECK_EQUAL( partial.liquidatable, now > due );
      BOOST_CHECK( !partial.liquidatable || expected );
   }
}

BOOST_AUTO_TEST_CASE( settlement_window )
{
   loan_object loan = make_active_loan();
   BOOST_CHECK( loan.is_open_for_settlement( due ) );

   loan.status = loan_status::voting;
   loan.voting_deadline = due + 3 * 24 * 60 * 60;
   BOOST_CHECK( !loan.is_open_for_settlement( loan.voting_deadline ) );
   BOOST_CHECK( loan.is_open_for_settlement( loan.voting_deadline + 1 ) );

   loan.resolution = vote_choice::liquidate;
   BOOST_CHECK( loan.is_open_for_settlement( due + 1 ) );

   loan.resolution = vote_choice::claim_proportional;
   BOOST_CHECK( !loan.is_open_for_settlement( due + 1 ) );

   for( auto s : { loan_status::requested, loan_status::funded, loan_status::repaid, loan_status::expired,
                   loan_status::liquidated, loan_status::partially_claimed } )
   {
      loan.status = s;
      BOOST_CHECK( !loan.is_open_for_settlement( loan.voting_deadline + 1 ) );
   }
}

BOOST_AUTO_TEST_CASE( terminal_statuses )
{
   BOOST_CHECK( is_terminal( loan_status::repaid ) );
   BOOST_CHECK( is_terminal( loan_status::expired ) );
   BOOST_CHECK( is_terminal( loan_status::liquidated ) );
   BOOST_CHECK( is_terminal( loan_status::partially_claimed ) );
   BOOST_CHECK( !is_terminal( loan_status::requested ) );
   BOOST_CHECK( !is_terminal( loan_status::funded ) );
   BOOST_CHECK( !is_terminal( loan_status::active ) );
   BOOST_CHECK( !is_terminal( loan_status::past_due ) );
   BOOST_CHECK( !is_terminal( loan_status::voting ) );
}

BOOST_AUTO_TEST_CASE( interest_rounds_down )
{
   BOOST_CHECK( calculate_interest( usdc(1000), 500 ) == usdc(50) );
   BOOST_CHECK( calculate_interest( amount_type(999), 1 ) == 0 );
   BOOST_CHECK( calculate_interest( amount_type(10001), 1 ) == 1 );
   BOOST_CHECK( calculate_interest( amount_type(12345), 0 ) == 0 );
   BOOST_CHECK( calculate_interest( amount_type(12345), LOANCHAIN_100_PERCENT ) == amount_type(12345) );

   loan_object loan = make_active_loan();
   loan.interest_rate_bps = 750;
   BOOST_CHECK( loan.interest() == usdc(75) );
   BOOST_CHECK( loan.total_due() == usdc(1075) );
}

BOOST_AUTO_TEST_CASE( pro_rata_split_assigns_remainder_to_first_lender )
{ try {
   account_id_type a( 10 ), b( 11 ), c( 12 );
   vector<lender_share> shares = { { a, 1 }, { b, 1 }, { c, 1 } };

   auto payouts = split_pro_rata( shares, 3, 100 );
   BOOST_REQUIRE_EQUAL( payouts.size(), 3u );
   BOOST_CHECK( payouts[0].lender == a );
   BOOST_CHECK( payouts[0].amount == 34 );
   BOOST_CHECK( payouts[1].amount == 33 );
   BOOST_CHECK( payouts[2].amount == 33 );

   shares = { { a, usdc(600) }, { b, usdc(400) } };
   payouts = split_pro_rata( shares, usdc(1000), usdc(1050) );
   BOOST_CHECK( payouts[0].amount == usdc(630) );
   BOOST_CHECK( payouts[1].amount == usdc(420) );

   BOOST_TEST_MESSAGE( "Payouts always add up to the total" );
   for( int i = 0; i < 500; ++i )
   {
      shares.clear();
      amount_type principal = 0;
      const int lenders = 1 + std::rand() % 7;
      for( int j = 0; j < lenders; ++j )
      {
         const amount_type contribution = 1 + std::rand() % 1000000;
         shares.push_back( { account_id_type( 10 + j ), contribution } );
         principal += contribution;
      }
      const amount_type total = random_value();
      amount_type sum = 0;
      for( const auto& p : split_pro_rata( shares, principal, total ) )
         sum += p.amount;
      BOOST_CHECK( sum == total );
   }

   BOOST_TEST_MESSAGE( "Contributions must add up to the principal" );
   shares = { { a, 1 }, { b, 1 } };
   BOOST_CHECK_THROW( split_pro_rata( shares, 3, 100 ), fc::exception );
   BOOST_CHECK_THROW( split_pro_rata( vector<lender_share>(), 3, 100 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
