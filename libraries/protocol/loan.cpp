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
#include <loanchain/protocol/loan.hpp>

namespace loanchain { namespace protocol {

bool is_terminal( loan_status s )
{
   switch( s )
   {
      case loan_status::repaid:
      case loan_status::expired:
      case loan_status::liquidated:
      case loan_status::partially_claimed:
         return true;
      default:
         return false;
   }
}

void loan_request_operation::validate()const
{
   FC_ASSERT( principal > 0, "Principal should be positive" );
   FC_ASSERT( is_valid_amount( principal ), "Principal is too large" );
   FC_ASSERT( collateral_amount > 0, "Collateral amount should be positive" );
   FC_ASSERT( is_valid_amount( collateral_amount ), "Collateral amount is too large" );
   FC_ASSERT( interest_rate_bps <= LOANCHAIN_100_PERCENT, "Interest rate should not exceed 100%" );
   FC_ASSERT( duration_seconds >= LOANCHAIN_MIN_LOAN_DURATION && duration_seconds <= LOANCHAIN_MAX_LOAN_DURATION,
              "Invalid duration, should be between ${min} and ${max} seconds",
              ("min", LOANCHAIN_MIN_LOAN_DURATION)("max", LOANCHAIN_MAX_LOAN_DURATION) );
   FC_ASSERT( funding_period_seconds >= LOANCHAIN_MIN_FUNDING_PERIOD
              && funding_period_seconds <= LOANCHAIN_MAX_FUNDING_PERIOD,
              "Invalid funding period, should be between ${min} and ${max} seconds",
              ("min", LOANCHAIN_MIN_FUNDING_PERIOD)("max", LOANCHAIN_MAX_FUNDING_PERIOD) );
   FC_ASSERT( min_contribution <= principal, "Minimum contribution should not exceed the principal" );
   FC_ASSERT( document_ref.size() <= LOANCHAIN_MAX_DOCUMENT_REF_LENGTH,
              "Document reference should not be longer than ${n} characters",
              ("n", LOANCHAIN_MAX_DOCUMENT_REF_LENGTH) );
}

void loan_contribute_operation::validate()const
{
   FC_ASSERT( amount > 0, "Contribution should be positive" );
   FC_ASSERT( is_valid_amount( amount ), "Contribution is too large" );
}

void loan_repay_operation::validate()const
{
   FC_ASSERT( amount > 0, "Repayment should be positive" );
   FC_ASSERT( is_valid_amount( amount ), "Repayment is too large" );
}

} } // loanchain::protocol
