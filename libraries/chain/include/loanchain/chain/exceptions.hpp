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

#include <fc/exception/exception.hpp>
#include <loanchain/protocol/exceptions.hpp>
#include <loanchain/chain/types.hpp>

#define LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( op_name )               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      loanchain::chain::operation_validate_exception,                 \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      loanchain::chain::operation_evaluate_exception,                 \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
      )

#define LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( op_name )             \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _validate_exception,                                 \
      loanchain::chain::operation_validate_exception,                 \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _evaluate_exception,                                 \
      loanchain::chain::operation_evaluate_exception,                 \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      loanchain::chain::op_name ## _evaluate_exception,               \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum                                                     \
      )

#define LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _ ## exc_name,                                       \
      loanchain::chain::op_name ## _evaluate_exception,               \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

namespace loanchain { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception,  chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,       chain_exception, 3070000 )
   FC_DECLARE_DERIVED_EXCEPTION( valuation_exception,           chain_exception, 3110000 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,          chain_exception, 3120000 )

   FC_DECLARE_DERIVED_EXCEPTION( unknown_token,                 database_query_exception, 3010001 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_loan,                  database_query_exception, 3010002 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_account,               database_query_exception, 3010003 )

   FC_DECLARE_DERIVED_EXCEPTION( transaction_sequence_mismatch, transaction_process_exception, 3030001 )
   FC_DECLARE_DERIVED_EXCEPTION( time_goes_backwards,           transaction_process_exception, 3030002 )

   /// The quote of a feed is older than the accepted age, or the feed could not be read at all
   FC_DECLARE_DERIVED_EXCEPTION( stale_quote,                   valuation_exception, 3110001 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( transfer );

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( token_register );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, token_register, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( duplicate_symbol, token_register, 2 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( duplicate_native, token_register, 3 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( token_deactivate );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, token_deactivate, 1 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( price_feed_publish );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, price_feed_publish, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( future_quote, price_feed_publish, 2 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( outdated_quote, price_feed_publish, 3 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( loan_request );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( token_inactive, loan_request, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( interest_rate_too_high, loan_request, 2 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( insufficient_collateral, loan_request, 3 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( loan_contribute );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( wrong_status, loan_contribute, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( funding_closed, loan_contribute, 2 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( insufficient_capacity, loan_contribute, 3 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( below_minimum, loan_contribute, 4 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( self_funding, loan_contribute, 5 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( loan_refund );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( wrong_status, loan_refund, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( not_lender, loan_refund, 2 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( loan_repay );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( wrong_status, loan_repay, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( not_borrower, loan_repay, 2 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( amount_mismatch, loan_repay, 3 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( loan_vote );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( wrong_status, loan_vote, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( not_lender, loan_vote, 2 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( double_vote, loan_vote, 3 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( voting_closed, loan_vote, 4 )

   LOANCHAIN_DECLARE_OP_BASE_EXCEPTIONS( loan_liquidate );
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( terminal_loan, loan_liquidate, 1 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( wrong_status, loan_liquidate, 2 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( not_liquidatable, loan_liquidate, 3 )
   LOANCHAIN_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized, loan_liquidate, 4 )

} } // loanchain::chain
