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
#include <loanchain/app/api.hpp>

#include <algorithm>

namespace loanchain { namespace app {

ledger_api::ledger_api( chain::database& db ):_db(db){}

time_point_sec ledger_api::get_head_time()const
{
   return _db.head_time();
}

loan_id_type ledger_api::get_next_loan_id()const
{
   return _db.get_next_loan_id();
}

optional<loan_object> ledger_api::get_loan( loan_id_type id )const
{
   const loan_object* loan = _db.find( id );
   if( loan == nullptr )
      return optional<loan_object>();
   return *loan;
}

vector<loan_id_type> ledger_api::get_active_loan_ids()const
{
   vector<loan_id_type> result;
   const auto& idx = _db.get_index_type<loan_index>().indices().get<by_status>();
   for( auto status : { loan_status::active, loan_status::voting } )
   {
      auto range = idx.equal_range( boost::make_tuple( status ) );
      for( auto itr = range.first; itr != range.second; ++itr )
         result.push_back( itr->get_id() );
   }
   std::sort( result.begin(), result.end() );
   return result;
}

vector<loan_contribution_object> ledger_api::get_contributions( loan_id_type id )const
{
   vector<loan_contribution_object> result;
   const auto& idx = _db.get_index_type<loan_contribution_index>().indices().get<by_loan>();
   auto itr = idx.lower_bound( boost::make_tuple( id ) );
   for( ; itr != idx.end() && itr->loan == id; ++itr )
      result.push_back( *itr );
   return result;
}

vector<loan_event_object> ledger_api::get_loan_events( loan_id_type id )const
{
   vector<loan_event_object> result;
   const auto& idx = _db.get_index_type<loan_event_index>().indices().get<by_loan>();
   auto itr = idx.lower_bound( boost::make_tuple( id ) );
   for( ; itr != idx.end() && itr->loan == id; ++itr )
      result.push_back( *itr );
   return result;
}

token_object ledger_api::get_token( token_id_type id )const
{
   return _db.get_token( id );
}

vector<token_object> ledger_api::list_tokens()const
{
   const auto& idx = _db.get_index_type<token_index>().indices().get<by_id>();
   return vector<token_object>( idx.begin(), idx.end() );
}

usd_valuation ledger_api::get_usd_value( token_id_type token, const amount_type& raw_amount )const
{
   return _db.get_usd_value( _db.get_token( token ), raw_amount );
}

optional<account_object> ledger_api::get_account_by_name( const string& name )const
{
   const account_object* account = _db.find_account_by_name( name );
   if( account == nullptr )
      return optional<account_object>();
   return *account;
}

uint32_t ledger_api::get_next_sequence( account_id_type account )const
{
   return _db.get_account( account ).next_sequence;
}

amount_type ledger_api::get_balance( account_id_type account, token_id_type token )const
{
   return _db.get_balance( account, token );
}

processed_transaction ledger_api::broadcast_transaction_synchronous( const transaction& trx )
{
   return _db.push_transaction( trx );
}

} } // loanchain::app
