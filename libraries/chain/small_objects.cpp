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
#include <loanchain/chain/global_property_object.hpp>
#include <loanchain/chain/loan_accounting.hpp>
#include <loanchain/chain/loan_object.hpp>
#include <loanchain/chain/token_object.hpp>

namespace loanchain { namespace chain {

void chain_parameters::validate()const
{
   FC_ASSERT( max_quote_age_seconds > 0, "Maximum quote age should be positive" );
   FC_ASSERT( voting_period_seconds > 0, "Voting period should be positive" );
   FC_ASSERT( max_interest_rate_bps <= LOANCHAIN_100_PERCENT, "Maximum interest rate should not exceed 100%" );
}

transfer_strategy token_object::get_transfer_strategy()const
{
   if( kind == token_kind::native )
      return native_transfer();
   return fungible_transfer{ asset_ref };
}

amount_type loan_object::interest()const
{
   return calculate_interest( principal, interest_rate_bps );
}

bool loan_object::is_past_due( time_point_sec now )const
{
   return due_date != time_point_sec() && now > due_date;
}

bool loan_object::is_open_for_settlement( time_point_sec now )const
{
   switch( status )
   {
      case loan_status::active:
         return true;
      case loan_status::voting:
         return ( resolution.valid() && *resolution == vote_choice::liquidate ) || now > voting_deadline;
      default:
         return false;
   }
}

} } // loanchain::chain
