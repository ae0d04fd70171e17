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
#include <loanchain/chain/loan_accounting.hpp>

namespace loanchain { namespace chain {

vector<lender_payout> split_pro_rata( const vector<lender_share>& shares,
                                      const amount_type& principal,
                                      const amount_type& total )
{ try {
   FC_ASSERT( !shares.empty(), "Nothing to split among" );
   FC_ASSERT( principal > 0, "Principal should be positive" );

   vector<lender_payout> result;
   result.reserve( shares.size() );
   amount_type paid_out = 0;
   amount_type contributed = 0;
   for( const auto& share : shares )
   {
      amount_type amount = mul_div( total, share.contribution, principal );
      paid_out += amount;
      contributed += share.contribution;
      result.push_back( lender_payout{ share.lender, amount } );
   }
   FC_ASSERT( contributed == principal, "Contributions ${c} do not add up to the principal ${p}",
              ("c",contributed)("p",principal) );
   FC_ASSERT( paid_out <= total, "Pro rata payouts exceed the amount to split" );
   result.front().amount += total - paid_out;
   return result;
} FC_CAPTURE_AND_RETHROW( (shares)(principal)(total) ) }

amount_type calculate_interest( const amount_type& principal, uint16_t rate_bps )
{
   return mul_div( principal, rate_bps, LOANCHAIN_100_PERCENT );
}

} } // loanchain::chain
