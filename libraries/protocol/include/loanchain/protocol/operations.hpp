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
#include <loanchain/protocol/base.hpp>
#include <loanchain/protocol/loan.hpp>
#include <loanchain/protocol/token.hpp>
#include <loanchain/protocol/transfer.hpp>

namespace loanchain { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   using operation = fc::static_variant<
            /*  0 */ transfer_operation,
            /*  1 */ token_register_operation,
            /*  2 */ token_deactivate_operation,
            /*  3 */ price_feed_publish_operation,
            /*  4 */ loan_request_operation,
            /*  5 */ loan_contribute_operation,
            /*  6 */ loan_refund_operation,
            /*  7 */ loan_repay_operation,
            /*  8 */ loan_vote_operation,
            /*  9 */ loan_liquidate_operation
         >;

   /// @} // operations group

   /**
    *  Appends the accounts named by @p op to @p result
    */
   void operation_get_acting_accounts( const operation& op, flat_set<account_id_type>& result );

   void operation_validate( const operation& op );

} } // loanchain::protocol

FC_REFLECT_TYPENAME( loanchain::protocol::operation )
