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

#include <loanchain/liquidator/exceptions.hpp>
#include <loanchain/liquidator/retry_policy.hpp>

#include <fc/exception/exception.hpp>

using namespace loanchain::liquidator;

namespace {

struct recording_sleep
{
   std::vector<fc::microseconds> delays;

   sleep_function get()
   {
      return [this]( fc::microseconds d ) { delays.push_back( d ); };
   }
};

}

BOOST_AUTO_TEST_SUITE( retry_policy_tests )

BOOST_AUTO_TEST_CASE( delays_repeat_the_last_entry )
{ try {
   retry_policy policy( 5, { fc::seconds(1), fc::seconds(2), fc::seconds(4) } );
   BOOST_CHECK_EQUAL( policy.max_attempts(), 5u );
   BOOST_CHECK( policy.delay_after( 0 ) == fc::microseconds( 0 ) );
   BOOST_CHECK( policy.delay_after( 1 ) == fc::seconds( 1 ) );
   BOOST_CHECK( policy.delay_after( 2 ) == fc::seconds( 2 ) );
   BOOST_CHECK( policy.delay_after( 3 ) == fc::seconds( 4 ) );
   BOOST_CHECK( policy.delay_after( 9 ) == fc::seconds( 4 ) );

   retry_policy no_delay( 2, {} );
   BOOST_CHECK( no_delay.delay_after( 1 ) == fc::microseconds( 0 ) );

   const retry_policy fixed = retry_policy::fixed( 3, fc::milliseconds( 250 ) );
   BOOST_CHECK_EQUAL( fixed.max_attempts(), 3u );
   BOOST_CHECK( fixed.delay_after( 1 ) == fc::milliseconds( 250 ) );
   BOOST_CHECK( fixed.delay_after( 2 ) == fc::milliseconds( 250 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( invalid_policies_are_rejected )
{
   BOOST_CHECK_THROW( retry_policy( 0, { fc::seconds(1) } ), fc::exception );
   BOOST_CHECK_THROW( retry_policy( 3, { fc::seconds(1), fc::microseconds(-1) } ), fc::exception );
}

BOOST_AUTO_TEST_CASE( unavailable_ledger_is_retried )
{ try {
   recording_sleep sleep;
   retry_policy policy( 4, { fc::seconds(1), fc::seconds(2) } );

   uint32_t calls = 0;
   const int result = policy.run( "flaky read", sleep.get(), [&calls]() -> int {
      if( ++calls < 3 )
         FC_THROW_EXCEPTION( ledger_unavailable_exception, "connection refused" );
      return 7;
   } );

   BOOST_CHECK_EQUAL( result, 7 );
   BOOST_CHECK_EQUAL( calls, 3u );
   BOOST_REQUIRE_EQUAL( sleep.delays.size(), 2u );
   BOOST_CHECK( sleep.delays[0] == fc::seconds( 1 ) );
   BOOST_CHECK( sleep.delays[1] == fc::seconds( 2 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( retries_stop_after_max_attempts )
{ try {
   recording_sleep sleep;
   const retry_policy policy = retry_policy::fixed( 3, fc::seconds( 5 ) );

   uint32_t calls = 0;
   BOOST_CHECK_THROW( policy.run( "dead read", sleep.get(), [&calls]() -> int {
      ++calls;
      FC_THROW_EXCEPTION( ledger_unavailable_exception, "connection refused" );
   } ), ledger_unavailable_exception );

   BOOST_CHECK_EQUAL( calls, 3u );
   BOOST_CHECK_EQUAL( sleep.delays.size(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( other_errors_are_not_retried )
{ try {
   recording_sleep sleep;
   const retry_policy policy = retry_policy::fixed( 5, fc::seconds( 1 ) );

   uint32_t calls = 0;
   BOOST_CHECK_THROW( policy.run( "bad read", sleep.get(), [&calls]() -> int {
      ++calls;
      FC_ASSERT( false, "the ledger said no" );
      return 0;
   } ), fc::assert_exception );
   BOOST_CHECK_EQUAL( calls, 1u );

   BOOST_CHECK_THROW( policy.run( "timed out", sleep.get(), [&calls]() -> int {
      ++calls;
      FC_THROW_EXCEPTION( settlement_timeout_exception, "no confirmation" );
   } ), settlement_timeout_exception );
   BOOST_CHECK_EQUAL( calls, 2u );
   BOOST_CHECK( sleep.delays.empty() );

   BOOST_TEST_MESSAGE( "Void calls are supported" );
   policy.run( "void call", sleep.get(), [&calls]() { ++calls; } );
   BOOST_CHECK_EQUAL( calls, 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( exception_hierarchy )
{
   const ledger_unavailable_exception unavailable;
   const settlement_timeout_exception timeout;
   BOOST_CHECK( dynamic_cast<const liquidator_exception*>( &unavailable ) != nullptr );
   BOOST_CHECK( dynamic_cast<const liquidator_exception*>( &timeout ) != nullptr );
   BOOST_CHECK( unavailable.code() != timeout.code() );
}

BOOST_AUTO_TEST_SUITE_END()
