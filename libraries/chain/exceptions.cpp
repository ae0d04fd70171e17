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
#include <loanchain/chain/exceptions.hpp>

namespace loanchain { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000, "transaction processing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception,  chain_exception, 3040000, "operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000, "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,       chain_exception, 3070000, "undo database exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( valuation_exception,           chain_exception, 3110000, "valuation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,          chain_exception, 3120000, "insufficient balance" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_token,   database_query_exception, 3010001, "unknown token" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_loan,    database_query_exception, 3010002, "unknown loan" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_account, database_query_exception, 3010003, "unknown account" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_sequence_mismatch, transaction_process_exception, 3030001,
                                   "transaction sequence does not match the next sequence of the signer" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( time_goes_backwards, transaction_process_exception, 3030002,
                                   "ledger time can only move forward" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( stale_quote, valuation_exception, 3110001, "stale price quote" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( transfer );

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( token_register );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, token_register, 1, "only the administrator may register tokens" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( duplicate_symbol, token_register, 2, "token id already active" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( duplicate_native, token_register, 3, "a native token is already active" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( token_deactivate );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, token_deactivate, 1, "only the administrator may deactivate tokens" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( price_feed_publish );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, price_feed_publish, 1, "publisher is not a feed producer" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( future_quote, price_feed_publish, 2, "quote is dated in the future" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( outdated_quote, price_feed_publish, 3, "quote is older than the current one" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_request );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( token_inactive, loan_request, 1, "token not supported" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( interest_rate_too_high, loan_request, 2, "interest rate too high" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( insufficient_collateral, loan_request, 3, "insufficient collateral" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_contribute );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( wrong_status, loan_contribute, 1, "loan is not open for funding" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( funding_closed, loan_contribute, 2, "funding period has ended" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( insufficient_capacity, loan_contribute, 3, "insufficient remaining capacity" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( below_minimum, loan_contribute, 4, "contribution below minimum" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( self_funding, loan_contribute, 5, "borrower cannot fund own loan" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_refund );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( wrong_status, loan_refund, 1, "loan has not expired" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_lender, loan_refund, 2, "account has not contributed to the loan" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_repay );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( wrong_status, loan_repay, 1, "loan is not active" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_borrower, loan_repay, 2, "only the borrower may repay" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( amount_mismatch, loan_repay, 3, "repayment amount mismatch" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_vote );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( wrong_status, loan_vote, 1, "loan is not in voting" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_lender, loan_vote, 2, "only lenders may vote" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( double_vote, loan_vote, 3, "lender has already voted" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( voting_closed, loan_vote, 4, "voting period has ended" )

   LOANCHAIN_IMPLEMENT_OP_BASE_EXCEPTIONS( loan_liquidate );
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( terminal_loan, loan_liquidate, 1, "loan is already settled" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( wrong_status, loan_liquidate, 2, "loan cannot be liquidated in its status" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( not_liquidatable, loan_liquidate, 3, "loan is not liquidatable" )
   LOANCHAIN_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized, loan_liquidate, 4, "account is not the designated liquidator" )

} } // loanchain::chain
