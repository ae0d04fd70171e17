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
#include <loanchain/chain/loan_object.hpp>

namespace loanchain { namespace chain {

   /// Outcome of a liquidation check together with the reasons behind it
   struct liquidation_verdict
   {
      bool liquidatable         = false;
      bool past_due             = false;
      bool under_collateralized = false;
      /// false if the loan could only be judged by time
      bool valued               = false;
   };

   /// collateral_value * 100 < loan_value * LOANCHAIN_LIQUIDATION_THRESHOLD_PERCENT
   bool is_under_collateralized( const amount_type& loan_value, const amount_type& collateral_value );

   /**
    *  A loan may be liquidated once it is past due or once its collateral is worth less than
    *  120% of its principal. Both values are USD amounts of the same precision.
    */
   bool is_liquidatable( const loan_object& loan, const amount_type& loan_value,
                         const amount_type& collateral_value, time_point_sec now );

   /**
    *  Same as @ref is_liquidatable, but either value may be missing because its valuation
    *  failed. Without both values only the due date is considered.
    */
   liquidation_verdict evaluate_liquidation( const loan_object& loan,
                                             const optional<amount_type>& loan_value,
                                             const optional<amount_type>& collateral_value,
                                             time_point_sec now );

} } // loanchain::chain

FC_REFLECT( loanchain::chain::liquidation_verdict, (liquidatable)(past_due)(under_collateralized)(valued) )
