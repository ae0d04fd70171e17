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

#include <loanchain/chain/loan_evaluator.hpp>
#include <loanchain/chain/token_evaluator.hpp>
#include <loanchain/chain/transfer_evaluator.hpp>

namespace loanchain { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize( 255 );
   register_evaluator<transfer_evaluator>();
   register_evaluator<token_register_evaluator>();
   register_evaluator<token_deactivate_evaluator>();
   register_evaluator<price_feed_publish_evaluator>();
   register_evaluator<loan_request_evaluator>();
   register_evaluator<loan_contribute_evaluator>();
   register_evaluator<loan_refund_evaluator>();
   register_evaluator<loan_repay_evaluator>();
   register_evaluator<loan_vote_evaluator>();
   register_evaluator<loan_liquidate_evaluator>();
}

void database::initialize_indexes()
{
   _undo_db.disable();

   //Protocol object indexes
   add_index< account_index           >();
   add_index< token_index             >();
   add_index< price_feed_index        >();
   add_index< loan_index              >();
   add_index< loan_contribution_index >();
   add_index< loan_vote_index         >();

   //Implementation object indexes
   add_index< global_property_index   >();
   add_index< account_balance_index   >();
   add_index< loan_event_index        >();
}

} }
