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
#include <loanchain/chain/liquidation.hpp>

namespace loanchain { namespace chain {

bool is_under_collateralized( const amount_type& loan_value, const amount_type& collateral_value )
{
   return wide_amount_type( collateral_value ) * 100
          < wide_amount_type( loan_value ) * LOANCHAIN_LIQUIDATION_THRESHOLD_PERCENT;
}

bool is_liquidatable( const loan_object& loan, const amount_type& loan_value,
                      const amount_type& collateral_value, time_point_sec now )
{
   return loan.is_past_due( now ) || is_under_collateralized( loan_value, collateral_value );
}

liquidation_verdict evaluate_liquidation( const loan_object& loan,
                                          const optional<amount_type>& loan_value,
                                          const optional<amount_type>& collateral_value,
                                          time_point_sec now )
{
   liquidation_verdict verdict;
   verdict.past_due = loan.is_past_due( now );
   verdict.valued = loan_value.valid() && collateral_value.valid();
   if( verdict.valued )
      verdict.under_collateralized = is_under_collateralized( *loan_value, *collateral_value );
   verdict.liquidatable = verdict.past_due || verdict.under_collateralized;
   return verdict;
}

} } // loanchain::chain
