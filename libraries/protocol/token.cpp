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
#include <loanchain/protocol/token.hpp>

#include <cctype>

namespace loanchain { namespace protocol {

/**
 *  Valid symbols contain upper case letters and digits and start with a letter.
 */
bool is_valid_token_symbol( const string& symbol )
{
   if( symbol.size() < LOANCHAIN_MIN_TOKEN_SYMBOL_LENGTH )
      return false;
   if( symbol.size() > LOANCHAIN_MAX_TOKEN_SYMBOL_LENGTH )
      return false;
   if( !std::isupper( static_cast<unsigned char>( symbol.front() ) ) )
      return false;
   for( const auto c : symbol )
   {
      if( !std::isupper( static_cast<unsigned char>(c) ) && !std::isdigit( static_cast<unsigned char>(c) ) )
         return false;
   }
   return true;
}

static void validate_feed_name( const string& feed )
{
   FC_ASSERT( !feed.empty(), "Price feed name should not be empty" );
   FC_ASSERT( feed.size() <= LOANCHAIN_MAX_FEED_NAME_LENGTH,
              "Price feed name should not be longer than ${n} characters",
              ("n", LOANCHAIN_MAX_FEED_NAME_LENGTH) );
}

void token_register_operation::validate()const
{
   FC_ASSERT( is_valid_token_symbol( symbol ), "Invalid token symbol", ("symbol",symbol) );
   FC_ASSERT( decimals <= LOANCHAIN_MAX_TOKEN_DECIMALS,
              "Token precision should not exceed ${d} decimals", ("d", LOANCHAIN_MAX_TOKEN_DECIMALS) );
   if( kind == token_kind::native )
      FC_ASSERT( asset_ref.empty(), "The native token has no asset reference" );
   else
      FC_ASSERT( !asset_ref.empty(), "A fungible token needs an asset reference" );
   validate_feed_name( price_feed );
}

void price_feed_publish_operation::validate()const
{
   validate_feed_name( feed );
   FC_ASSERT( price > 0, "Price should be positive" );
   FC_ASSERT( is_valid_amount( price ), "Price is too large" );
   FC_ASSERT( decimals <= LOANCHAIN_MAX_PRICE_DECIMALS,
              "Price precision should not exceed ${d} decimals", ("d", LOANCHAIN_MAX_PRICE_DECIMALS) );
}

} } // loanchain::protocol
