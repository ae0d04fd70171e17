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
#include <loanchain/chain/exceptions.hpp>
#include <loanchain/chain/valuation.hpp>

namespace loanchain { namespace chain {

amount_type to_usd_value( const amount_type& raw_amount, uint8_t token_decimals, const price_quote& quote )
{ try {
   FC_ASSERT( token_decimals <= LOANCHAIN_MAX_TOKEN_DECIMALS );
   FC_ASSERT( quote.decimals <= LOANCHAIN_MAX_PRICE_DECIMALS );
   wide_amount_type numerator = wide_amount_type( raw_amount ) * wide_amount_type( quote.price )
                                * wide_amount_type( pow10( LOANCHAIN_USD_DECIMALS ) );
   wide_amount_type denominator = wide_amount_type( pow10( token_decimals ) )
                                  * wide_amount_type( pow10( quote.decimals ) );
   wide_amount_type result = numerator / denominator;
   FC_ASSERT( result <= wide_amount_type( max_amount() ), "USD value overflow" );
   return amount_type( result );
} FC_CAPTURE_AND_RETHROW( (raw_amount)(token_decimals)(quote) ) }

usd_valuation valuation_engine::usd_value( const token_object& token, const amount_type& raw_amount,
                                           time_point_sec now )const
{
   price_quote quote;
   try {
      quote = _oracle.latest_quote( token.price_feed );
   } catch( const stale_quote& ) {
      throw;
   } catch( const fc::exception& e ) {
      FC_THROW_EXCEPTION( stale_quote, "Price feed ${f} of token ${t} is unavailable: ${e}",
                          ("f",token.price_feed)("t",token.symbol)("e",e.to_string()) );
   }

   LOANCHAIN_ASSERT( quote.updated_at >= now
                     || uint32_t( ( now - quote.updated_at ).to_seconds() ) <= _max_quote_age,
                     stale_quote, "Price data too old: quote of ${f} dates from ${u}, now is ${n}",
                     ("f",token.price_feed)("u",quote.updated_at)("n",now) );

   usd_valuation result;
   result.value = to_usd_value( raw_amount, token.decimals, quote );
   result.as_of = quote.updated_at;
   return result;
}

} } // loanchain::chain
