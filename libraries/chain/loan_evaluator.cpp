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
#include <loanchain/chain/loan_evaluator.hpp>

#include <loanchain/chain/database.hpp>
#include <loanchain/chain/exceptions.hpp>

namespace loanchain { namespace chain {

namespace {

   const loan_contribution_object* find_contribution( const database& d, loan_id_type loan, account_id_type lender )
   {
      const auto& idx = d.get_index_type<loan_contribution_index>().indices().get<by_loan_lender>();
      auto itr = idx.find( boost::make_tuple( loan, lender ) );
      if( itr == idx.end() )
         return nullptr;
      return &*itr;
   }

   /// strict majority of the principal
   bool is_majority( const amount_type& weight, const amount_type& principal )
   {
      return wide_amount_type( weight ) * 2 > wide_amount_type( principal );
   }

}

void_result loan_request_evaluator::do_evaluate( const loan_request_operation& op )
{ try {
   const database& d = db();
   const auto& params = d.get_chain_parameters();

   d.get_account( op.borrower );
   const token_object& loan_token = d.get_token( op.loan_token );
   _collateral_token = &d.get_token( op.collateral_token );

   LOANCHAIN_ASSERT( loan_token.active, loan_request_token_inactive,
                     "Loan token ${s} is not active", ("s",loan_token.symbol) );
   LOANCHAIN_ASSERT( _collateral_token->active, loan_request_token_inactive,
                     "Collateral token ${s} is not active", ("s",_collateral_token->symbol) );

   LOANCHAIN_ASSERT( op.interest_rate_bps <= params.max_interest_rate_bps, loan_request_interest_rate_too_high,
                     "Interest rate ${r} exceeds the maximum of ${m} basis points",
                     ("r",op.interest_rate_bps)("m",params.max_interest_rate_bps) );

   if( params.initial_collateral_percent > 0 )
   {
      const auto loan_value = d.get_usd_value( loan_token, op.principal );
      const auto collateral_value = d.get_usd_value( *_collateral_token, op.collateral_amount );
      LOANCHAIN_ASSERT( wide_amount_type( collateral_value.value ) * 100
                           >= wide_amount_type( loan_value.value ) * params.initial_collateral_percent,
                        loan_request_insufficient_collateral,
                        "Collateral worth ${c} USD does not cover ${p}% of the loan worth ${l} USD",
                        ("c",collateral_value.value)("p",params.initial_collateral_percent)("l",loan_value.value) );
   }

   const amount_type available = d.get_balance( d.get_account( op.borrower ), *_collateral_token );
   LOANCHAIN_ASSERT( available >= op.collateral_amount, insufficient_balance,
                     "Insufficient Balance: ${b} ${s} available, ${r} required for collateral",
                     ("b",available)("s",_collateral_token->symbol)("r",op.collateral_amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type loan_request_evaluator::do_apply( const loan_request_operation& op ) const
{ try {
   database& d = db();
   const auto now = d.head_time();

   d.reduce_balance( op.borrower, *_collateral_token, op.collateral_amount );

   const auto& new_loan = d.create<loan_object>( [&op,now]( loan_object& l ) {
      l.borrower = op.borrower;
      l.loan_token = op.loan_token;
      l.collateral_token = op.collateral_token;
      l.principal = op.principal;
      l.collateral_amount = op.collateral_amount;
      l.interest_rate_bps = op.interest_rate_bps;
      l.duration_seconds = op.duration_seconds;
      l.created_at = now;
      l.status = loan_status::requested;
      l.amount_funded = 0;
      l.risk_score = op.risk_score;
      l.min_contribution = op.min_contribution;
      l.funding_deadline = now + op.funding_period_seconds;
      l.document_ref = op.document_ref;
   });
   d.push_loan_event( new_loan, loan_event_type::requested );

   return new_loan.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_contribute_evaluator::do_evaluate( const loan_contribute_operation& op )
{ try {
   const database& d = db();

   d.get_account( op.lender );
   _loan = &d.get_loan( op.loan );

   LOANCHAIN_ASSERT( _loan->status == loan_status::requested, loan_contribute_wrong_status,
                     "Loan ${id} is not open for funding, its status is ${s}", ("id",op.loan)("s",_loan->status) );
   LOANCHAIN_ASSERT( d.head_time() <= _loan->funding_deadline, loan_contribute_funding_closed,
                     "The funding period of loan ${id} ended at ${t}", ("id",op.loan)("t",_loan->funding_deadline) );
   LOANCHAIN_ASSERT( op.lender != _loan->borrower, loan_contribute_self_funding,
                     "The borrower may not fund their own loan", ("id",op.loan) );

   const amount_type remaining = _loan->remaining_capacity();
   LOANCHAIN_ASSERT( op.amount <= remaining, loan_contribute_insufficient_capacity,
                     "Contribution ${a} exceeds the remaining amount ${r} of loan ${id}",
                     ("a",op.amount)("r",remaining)("id",op.loan) );
   LOANCHAIN_ASSERT( op.amount >= _loan->min_contribution || op.amount == remaining, loan_contribute_below_minimum,
                     "Contribution ${a} is below the minimum of ${m}", ("a",op.amount)("m",_loan->min_contribution) );

   _loan_token = &d.get_token( _loan->loan_token );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type loan_contribute_evaluator::do_apply( const loan_contribute_operation& op ) const
{ try {
   database& d = db();
   const auto now = d.head_time();

   d.reduce_balance( op.lender, *_loan_token, op.amount );

   object_id_type contribution_id;
   const loan_contribution_object* existing = find_contribution( d, op.loan, op.lender );
   if( existing != nullptr )
   {
      d.modify( *existing, [&op,now]( loan_contribution_object& c ) {
         c.amount += op.amount;
         c.timestamp = now;
      });
      contribution_id = existing->id;
   }
   else
   {
      contribution_id = d.create<loan_contribution_object>( [&op,now]( loan_contribution_object& c ) {
         c.loan = op.loan;
         c.lender = op.lender;
         c.amount = op.amount;
         c.timestamp = now;
      }).id;
   }

   d.modify( *_loan, [&op]( loan_object& l ) {
      l.amount_funded += op.amount;
   });

   if( _loan->amount_funded == _loan->principal )
   {
      d.modify( *_loan, []( loan_object& l ) {
         l.status = loan_status::funded;
      });
      d.push_loan_event( *_loan, loan_event_type::fully_funded );

      d.modify( *_loan, [now]( loan_object& l ) {
         l.funded_at = now;
         l.due_date = now + l.duration_seconds;
         l.status = loan_status::active;
      });
      d.add_balance( _loan->borrower, *_loan_token, _loan->principal );

      ilog( "Loan ${id} fully funded, ${p} ${s} disbursed to the borrower, due ${d}",
            ("id",_loan->id)("p",_loan->principal)("s",_loan_token->symbol)("d",_loan->due_date) );
   }

   return contribution_id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_refund_evaluator::do_evaluate( const loan_refund_operation& op )
{ try {
   const database& d = db();

   _loan = &d.get_loan( op.loan );
   LOANCHAIN_ASSERT( _loan->status == loan_status::expired, loan_refund_wrong_status,
                     "Only contributions to expired loans can be refunded, loan ${id} is ${s}",
                     ("id",op.loan)("s",_loan->status) );

   _contribution = find_contribution( d, op.loan, op.lender );
   LOANCHAIN_ASSERT( _contribution != nullptr, loan_refund_not_lender,
                     "Account ${a} did not contribute to loan ${id}", ("a",op.lender)("id",op.loan) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_refund_evaluator::do_apply( const loan_refund_operation& op ) const
{ try {
   if( _contribution->refunded )
      return void_result();

   database& d = db();
   d.add_balance( op.lender, d.get_token( _loan->loan_token ), _contribution->amount );
   d.modify( *_contribution, []( loan_contribution_object& c ) {
      c.refunded = true;
   });

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_repay_evaluator::do_evaluate( const loan_repay_operation& op )
{ try {
   const database& d = db();

   _loan = &d.get_loan( op.loan );
   LOANCHAIN_ASSERT( _loan->status == loan_status::active, loan_repay_wrong_status,
                     "Loan ${id} cannot be repaid, its status is ${s}", ("id",op.loan)("s",_loan->status) );
   LOANCHAIN_ASSERT( op.borrower == _loan->borrower, loan_repay_not_borrower,
                     "Only the borrower may repay loan ${id}", ("id",op.loan) );

   const amount_type due = _loan->total_due();
   LOANCHAIN_ASSERT( op.amount == due, loan_repay_amount_mismatch,
                     "Repayment ${a} does not match the outstanding ${d}", ("a",op.amount)("d",due) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_repay_evaluator::do_apply( const loan_repay_operation& op ) const
{ try {
   database& d = db();
   const token_object& loan_token = d.get_token( _loan->loan_token );

   d.reduce_balance( op.borrower, loan_token, op.amount );
   d.pay_lenders( *_loan, loan_token, op.amount );
   d.add_balance( _loan->borrower, d.get_token( _loan->collateral_token ), _loan->collateral_amount );

   d.modify( *_loan, []( loan_object& l ) {
      l.status = loan_status::repaid;
   });
   d.push_loan_event( *_loan, loan_event_type::repaid );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_vote_evaluator::do_evaluate( const loan_vote_operation& op )
{ try {
   const database& d = db();

   _loan = &d.get_loan( op.loan );
   LOANCHAIN_ASSERT( _loan->status == loan_status::voting, loan_vote_wrong_status,
                     "Loan ${id} is not being voted on, its status is ${s}", ("id",op.loan)("s",_loan->status) );
   LOANCHAIN_ASSERT( d.head_time() <= _loan->voting_deadline, loan_vote_voting_closed,
                     "Voting on loan ${id} closed at ${t}", ("id",op.loan)("t",_loan->voting_deadline) );

   _contribution = find_contribution( d, op.loan, op.lender );
   LOANCHAIN_ASSERT( _contribution != nullptr, loan_vote_not_lender,
                     "Account ${a} did not contribute to loan ${id}", ("a",op.lender)("id",op.loan) );

   const auto& idx = d.get_index_type<loan_vote_index>().indices().get<by_loan_lender>();
   LOANCHAIN_ASSERT( idx.find( boost::make_tuple( op.loan, op.lender ) ) == idx.end(), loan_vote_double_vote,
                     "Account ${a} already voted on loan ${id}", ("a",op.lender)("id",op.loan) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_vote_evaluator::do_apply( const loan_vote_operation& op ) const
{ try {
   database& d = db();

   d.create<loan_vote_object>( [this,&op]( loan_vote_object& v ) {
      v.loan = op.loan;
      v.lender = op.lender;
      v.choice = op.choice;
      v.weight = _contribution->amount;
   });

   if( is_majority( d.get_vote_weight( *_loan, vote_choice::claim_proportional ), _loan->principal ) )
   {
      d.pay_lenders( *_loan, d.get_token( _loan->collateral_token ), _loan->collateral_amount );
      d.remove_loan_votes( *_loan );
      d.modify( *_loan, []( loan_object& l ) {
         l.status = loan_status::partially_claimed;
         l.collateral_claimed = true;
         l.resolution = vote_choice::claim_proportional;
      });
      d.push_loan_event( *_loan, loan_event_type::partially_claimed );
      ilog( "Lenders of loan ${id} claimed its collateral", ("id",_loan->id) );
   }
   else if( !_loan->resolution.valid()
            && is_majority( d.get_vote_weight( *_loan, vote_choice::liquidate ), _loan->principal ) )
   {
      d.modify( *_loan, []( loan_object& l ) {
         l.resolution = vote_choice::liquidate;
      });
      ilog( "Lenders of loan ${id} voted for liquidation", ("id",_loan->id) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_liquidate_evaluator::do_evaluate( const loan_liquidate_operation& op )
{ try {
   const database& d = db();
   const auto now = d.head_time();

   _loan = &d.get_loan( op.loan );
   LOANCHAIN_ASSERT( !_loan->is_terminal(), loan_liquidate_terminal_loan,
                     "Loan ${id} is already settled, its status is ${s}", ("id",op.loan)("s",_loan->status) );

   const auto& designated = d.get_chain_parameters().designated_liquidator;
   LOANCHAIN_ASSERT( !designated.valid() || *designated == op.liquidator, loan_liquidate_unauthorized,
                     "Only ${l} may settle loans", ("l",*designated) );

   if( _loan->status == loan_status::active )
   {
      const liquidation_verdict verdict = d.check_liquidation( *_loan );
      LOANCHAIN_ASSERT( verdict.liquidatable, loan_liquidate_not_liquidatable,
                        "Loan ${id} is not liquidatable", ("id",op.loan)("verdict",verdict) );
   }
   else if( _loan->status == loan_status::voting )
   {
      LOANCHAIN_ASSERT( _loan->is_open_for_settlement( now ), loan_liquidate_not_liquidatable,
                        "Lenders of loan ${id} have not voted for liquidation and voting is open until ${t}",
                        ("id",op.loan)("t",_loan->voting_deadline) );
   }
   else
   {
      FC_THROW_EXCEPTION( loan_liquidate_wrong_status, "Loan ${id} cannot be settled, its status is ${s}",
                          ("id",op.loan)("s",_loan->status) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_liquidate_evaluator::do_apply( const loan_liquidate_operation& op ) const
{ try {
   database& d = db();
   const token_object& loan_token = d.get_token( _loan->loan_token );
   const amount_type due = _loan->total_due();

   d.reduce_balance( op.liquidator, loan_token, due );
   d.pay_lenders( *_loan, loan_token, due );
   d.add_balance( op.liquidator, d.get_token( _loan->collateral_token ), _loan->collateral_amount );
   d.remove_loan_votes( *_loan );

   d.modify( *_loan, []( loan_object& l ) {
      l.status = loan_status::liquidated;
      l.collateral_claimed = true;
   });
   d.push_loan_event( *_loan, loan_event_type::liquidated );
   ilog( "Loan ${id} liquidated by ${l} for ${d} ${s}",
         ("id",_loan->id)("l",op.liquidator)("d",due)("s",loan_token.symbol) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // loanchain::chain
