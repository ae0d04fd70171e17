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
#include <loanchain/chain/types.hpp>

namespace loanchain { namespace chain {

   struct lender_share
   {
      account_id_type lender;
      amount_type     contribution;
   };

   struct lender_payout
   {
      account_id_type lender;
      amount_type     amount;
   };

   /**
    *  Splits @p total among lenders in proportion to their contributions.
    *
    *  Each lender receives floor( total * contribution / principal ). What rounding leaves over
    *  is added to the first entry of @p shares, so the payouts always add up to @p total.
    *
    *  @param shares contributions in processing order, they must add up to @p principal
    */
   vector<lender_payout> split_pro_rata( const vector<lender_share>& shares,
                                         const amount_type& principal,
                                         const amount_type& total );

   /// floor( principal * rate_bps / 10000 )
   amount_type calculate_interest( const amount_type& principal, uint16_t rate_bps );

} } // loanchain::chain

FC_REFLECT( loanchain::chain::lender_share, (lender)(contribution) )
FC_REFLECT( loanchain::chain::lender_payout, (lender)(amount) )
