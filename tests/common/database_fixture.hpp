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

#include <fc/io/json.hpp>

#include <boost/test/unit_test.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <loanchain/chain/database.hpp>
#include <loanchain/chain/exceptions.hpp>
#include <loanchain/protocol/config.hpp>

#include <iostream>
#include <map>
#include <set>

using namespace loanchain::db;

extern uint32_t LOANCHAIN_TESTING_GENESIS_TIMESTAMP;

#define PUSH_TX \
   loanchain::chain::test::_push_transaction

#define LOANCHAIN_REQUIRE_THROW( expr, exc_type )         \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANCHAIN_REQUIRE_THROW begin "       \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANCHAIN_REQUIRE_THROW end "         \
         << req_throw_info << std::endl;                  \
}

#define LOANCHAIN_CHECK_THROW( expr, exc_type )           \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANCHAIN_CHECK_THROW begin "         \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LOANCHAIN_CHECK_THROW end "           \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   LOANCHAIN_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}
#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value ) \
   REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, fc::exception )

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                 \
{                                                                 \
   try                                                            \
   {                                                              \
      op;                                                         \
      BOOST_FAIL(std::string("Expected an exception with \"") +   \
         std::string(exc_text) +                                  \
         std::string("\" but none thrown"));                      \
   }                                                              \
   catch (fc::exception& ex)                                      \
   {                                                              \
      std::string what = ex.to_string(                            \
            fc::log_level(fc::log_level::all));                   \
      if (what.find(exc_text) == std::string::npos)               \
      {                                                           \
         BOOST_FAIL( std::string("Expected \"") +                 \
            std::string(exc_text) +                               \
            std::string("\" but got \"") +                        \
            std::string(what) );                                  \
      }                                                           \
   }                                                              \
}                                                                 \

#define ACTOR(name) \
   const auto& name = create_account(BOOST_PP_STRINGIZE(name)); \
   loanchain::chain::account_id_type name ## _id = name.get_id(); (void)name ## _id;

#define GET_ACTOR(name) \
   const account_object& name = get_account(BOOST_PP_STRINGIZE(name)); \
   loanchain::chain::account_id_type name ## _id = name.get_id(); \
   (void)name ##_id

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

/// 2000 USD per ETH and 1 USD per USDC, both quoted with 8 decimals
#define ETH_USD_PRICE  (loanchain::chain::amount_type(2000) * loanchain::protocol::pow10(8))
#define USDC_USD_PRICE (loanchain::protocol::pow10(8))

namespace loanchain { namespace chain {

namespace test {
processed_transaction _push_transaction( database& db, const transaction& tx );
} // namespace test

/// @return @p whole tokens of a token with @p decimals decimals in raw units
amount_type units( uint64_t whole, uint8_t decimals );
inline amount_type eth( uint64_t whole )  { return units( whole, 18 ); }
inline amount_type usdc( uint64_t whole ) { return units( whole, 6 ); }

/**
 *  A price source under the control of a test. Quotes are set directly, feeds can be made to fail
 *  and every lookup is counted.
 */
class test_price_oracle : public price_oracle
{
   public:
      price_quote latest_quote( const string& feed )const override;

      void set_quote( const string& feed, const amount_type& price, uint8_t decimals, time_point_sec updated_at );
      void fail( const string& feed ) { failing.insert( feed ); }
      void recover( const string& feed ) { failing.erase( feed ); }

      std::map<string, price_quote> quotes;
      std::set<string>              failing;
      mutable uint32_t              lookups = 0;
};

struct database_fixture {
   genesis_state_type genesis_state;
   chain::database db;
   account_id_type admin_id;
   token_id_type eth_id;
   token_id_type usdc_id;

   /// Everything ever minted per token, nothing can create or destroy funds after that
   std::map<token_id_type, amount_type> token_supply;

   const std::string current_test_name;

   database_fixture( const fc::time_point_sec& initial_timestamp =
                        fc::time_point_sec( LOANCHAIN_TESTING_GENESIS_TIMESTAMP ) );
   virtual ~database_fixture();

   static genesis_state_type make_genesis( const fc::time_point_sec& initial_timestamp );

   /// Checks that free balances and escrowed funds add up to the minted supply of every token
   void verify_token_supplies()const;

   const account_object& create_account( const string& name );
   const account_object& get_account( const string& name )const;
   const token_object& get_token( const string& symbol )const;

   /// Mints @p amount of @p token to @p account
   void fund( account_id_type account, token_id_type token, const amount_type& amount );
   amount_type get_balance( account_id_type account, token_id_type token )const;

   processed_transaction push_op( account_id_type signer, const operation& op );

   void advance_time( uint32_t seconds );

   void publish_feed( const string& feed, const amount_type& price, uint8_t decimals = 8 );
   /// Republishes the ETH and USDC quotes at their genesis prices, observed now
   void refresh_feeds();

   const token_object& register_token( const string& symbol, token_kind kind, uint8_t decimals,
                                       const string& feed, const string& asset_ref = "" );
   void deactivate_token( token_id_type token );

   /// 5% interest, 30 days, collateral in ETH and principal in USDC
   loan_request_operation make_loan_request( account_id_type borrower, const amount_type& principal,
                                             const amount_type& collateral );
   const loan_object& request_loan( const loan_request_operation& op );
   const loan_object& request_loan( account_id_type borrower, const amount_type& principal,
                                    const amount_type& collateral );
   void contribute( account_id_type lender, loan_id_type loan, const amount_type& amount );
   void refund( account_id_type lender, loan_id_type loan );
   void repay( account_id_type borrower, loan_id_type loan, const amount_type& amount );
   void vote( account_id_type lender, loan_id_type loan, vote_choice choice );
   void liquidate( account_id_type liquidator, loan_id_type loan );

   vector<loan_event_type> get_loan_event_types( loan_id_type loan )const;
   const loan_contribution_object* find_contribution( loan_id_type loan, account_id_type lender )const;
};

} }
