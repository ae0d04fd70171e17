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
#include <loanchain/chain/database.hpp>
#include <loanchain/chain/transaction_evaluation_state.hpp>

namespace loanchain { namespace chain {

processed_transaction database::push_transaction( const transaction& trx )
{ try {
   processed_transaction result;
   try {
      auto session = _undo_db.start_undo_session();
      result = _apply_transaction( trx );
      session.commit();
   } catch( const fc::exception& ) {
      discard_loan_events();
      throw;
   }
   notify_loan_events();
   return result;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::_apply_transaction( const transaction& trx )
{ try {
   FC_ASSERT( _initialized, "The ledger has not been initialized" );
   trx.validate();

   const account_object& signer = get_account( trx.signer );
   LOANCHAIN_ASSERT( trx.sequence == signer.next_sequence, transaction_sequence_mismatch,
                     "Transaction sequence ${s} of ${a} does not match the expected ${e}",
                     ("s",trx.sequence)("a",signer.name)("e",signer.next_sequence) );

   transaction_evaluation_state eval_state(this);
   eval_state._trx = &trx;

   processed_transaction ptrx( trx );
   eval_state.operation_results.reserve( trx.operations.size() );
   for( const auto& op : trx.operations )
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );

   modify( signer, []( account_object& a ) {
      ++a.next_sequence;
   });

   ptrx.applied_at = head_time();
   ptrx.operation_results = std::move( eval_state.operation_results );
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op",op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op",op) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op",op) );
   return eval->evaluate( eval_state, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::advance_time( time_point_sec new_time )
{ try {
   FC_ASSERT( _initialized, "The ledger has not been initialized" );
   const global_property_object& gpo = get_global_properties();
   LOANCHAIN_ASSERT( new_time >= gpo.time, time_goes_backwards,
                     "Cannot move ledger time from ${o} back to ${n}", ("o",gpo.time)("n",new_time) );
   try {
      auto session = _undo_db.start_undo_session();
      modify( gpo, [new_time]( global_property_object& p ) {
         p.time = new_time;
      });
      perform_loan_maintenance();
      session.commit();
   } catch( const fc::exception& ) {
      discard_loan_events();
      throw;
   }
   notify_loan_events();
} FC_CAPTURE_AND_RETHROW( (new_time) ) }

} }
