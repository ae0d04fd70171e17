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
#include <loanchain/chain/transfer_evaluator.hpp>

#include <loanchain/chain/database.hpp>
#include <loanchain/chain/exceptions.hpp>

namespace loanchain { namespace chain {

void_result transfer_evaluator::do_evaluate( const transfer_operation& op )
{ try {
   const database& d = db();

   const account_object& from_account = d.get_account( op.from );
   d.get_account( op.to );
   _token = &d.get_token( op.token );

   const amount_type available = d.get_balance( from_account, *_token );
   LOANCHAIN_ASSERT( available >= op.amount, insufficient_balance,
                     "Insufficient Balance: ${a}'s balance of ${b} ${s} is less than required ${r}",
                     ("a",from_account.name)("b",available)("s",_token->symbol)("r",op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_evaluator::do_apply( const transfer_operation& op ) const
{ try {
   database& d = db();
   d.reduce_balance( op.from, *_token, op.amount );
   d.add_balance( op.to, *_token, op.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // loanchain::chain
