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
#include <loanchain/protocol/types.hpp>

#include <fc/variant.hpp>

#include <cctype>

namespace loanchain { namespace protocol {

amount_type max_amount()
{
   static const amount_type result = ( amount_type(1) << LOANCHAIN_MAX_AMOUNT_BITS ) - 1;
   return result;
}

bool is_valid_amount( const amount_type& a )
{
   return a <= max_amount();
}

amount_type pow10( uint8_t exp )
{
   FC_ASSERT( exp <= 38, "Exponent ${e} is too large", ("e",exp) );
   amount_type result = 1;
   for( uint8_t i = 0; i < exp; ++i )
      result *= 10;
   return result;
}

amount_type mul_div( const amount_type& a, const amount_type& b, const amount_type& c )
{
   FC_ASSERT( c != 0, "Division by zero" );
   wide_amount_type result = wide_amount_type(a) * wide_amount_type(b) / wide_amount_type(c);
   FC_ASSERT( result <= wide_amount_type( max_amount() ), "Amount overflow",
              ("a",a)("b",b)("c",c) );
   return amount_type( result );
}

} } // loanchain::protocol

namespace fc {

void to_variant( const loanchain::protocol::amount_type& var, fc::variant& vo, uint32_t max_depth )
{
   vo = var.str();
}

void from_variant( const fc::variant& var, loanchain::protocol::amount_type& vo, uint32_t max_depth )
{ try {
   if( !var.is_string() )
   {
      vo = loanchain::protocol::amount_type( var.as_uint64() );
      return;
   }
   const auto& s = var.get_string();
   FC_ASSERT( !s.empty(), "Empty amount" );
   FC_ASSERT( s.size() <= 78, "Amount string is too long" );
   for( char c : s )
      FC_ASSERT( std::isdigit( static_cast<unsigned char>(c) ), "Amount must be a non-negative decimal integer" );
   vo = loanchain::protocol::amount_type( s.c_str() );
} FC_CAPTURE_AND_RETHROW( (var) ) }

} // fc
