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
#include <loanchain/liquidator/database_ledger_client.hpp>

namespace loanchain { namespace liquidator {

time_point_sec database_ledger_client::get_head_time()
{
   return _api.get_head_time();
}

loan_id_type database_ledger_client::get_next_loan_id()
{
   return _api.get_next_loan_id();
}

optional<loan_object> database_ledger_client::get_loan( loan_id_type id )
{
   return _api.get_loan( id );
}

usd_valuation database_ledger_client::get_usd_value( token_id_type token, const amount_type& raw_amount )
{
   return _api.get_usd_value( token, raw_amount );
}

optional<account_object> database_ledger_client::get_account_by_name( const std::string& name )
{
   return _api.get_account_by_name( name );
}

uint32_t database_ledger_client::get_next_sequence( account_id_type account )
{
   return _api.get_next_sequence( account );
}

vector<token_object> database_ledger_client::list_tokens()
{
   return _api.list_tokens();
}

amount_type database_ledger_client::get_balance( account_id_type account, token_id_type token )
{
   return _api.get_balance( account, token );
}

processed_transaction database_ledger_client::submit_and_wait( const transaction& trx, fc::microseconds )
{
   return _api.broadcast_transaction_synchronous( trx );
}

} } // loanchain::liquidator
