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
#include <loanchain/chain/token_object.hpp>
#include <loanchain/chain/types.hpp>

namespace loanchain { namespace chain {

   /**
    *  @brief a USD quote as reported by an oracle feed
    *
    *  @ref price is the USD price of one whole token with @ref decimals decimals.
    */
   struct price_quote
   {
      amount_type    price;
      uint8_t        decimals = 0;
      time_point_sec updated_at;
   };

   /// A USD amount with LOANCHAIN_USD_DECIMALS decimals and the time of the quote it is based on
   struct usd_valuation
   {
      amount_type    value;
      time_point_sec as_of;
   };

   /**
    *  @brief source of price quotes
    *
    *  Implementations throw when a feed is unknown or cannot be read.
    */
   class price_oracle
   {
      public:
         virtual ~price_oracle() = default;
         virtual price_quote latest_quote( const string& feed )const = 0;
   };

   /**
    *  Converts @p raw_amount of a token with @p token_decimals decimals to a USD amount with
    *  LOANCHAIN_USD_DECIMALS decimals, rounding down.
    */
   amount_type to_usd_value( const amount_type& raw_amount, uint8_t token_decimals, const price_quote& quote );

   /**
    *  @brief values token amounts in USD
    *
    *  A quote older than the maximum age is rejected with @ref stale_quote, and so is any failure of
    *  the oracle. Callers must not treat a failed valuation as a safe one.
    */
   class valuation_engine
   {
      public:
         valuation_engine( const price_oracle& oracle, uint32_t max_quote_age_seconds )
         :_oracle(oracle),_max_quote_age(max_quote_age_seconds){}

         usd_valuation usd_value( const token_object& token, const amount_type& raw_amount, time_point_sec now )const;

      private:
         const price_oracle& _oracle;
         uint32_t            _max_quote_age;
   };

} } // loanchain::chain

FC_REFLECT( loanchain::chain::price_quote, (price)(decimals)(updated_at) )
FC_REFLECT( loanchain::chain::usd_valuation, (value)(as_of) )
