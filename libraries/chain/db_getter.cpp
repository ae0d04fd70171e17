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

namespace loanchain { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const chain_parameters& database::get_chain_parameters()const
{
   return get_global_properties().parameters;
}

time_point_sec database::head_time()const
{
   return get_global_properties().time;
}

const account_object& database::get_account( account_id_type id )const
{
   const account_object* account = find( id );
   LOANCHAIN_ASSERT( account != nullptr, unknown_account, "Unknown account ${id}", ("id",id) );
   return *account;
}

const account_object& database::get_account_by_name( const string& name )const
{
   const account_object* account = find_account_by_name( name );
   LOANCHAIN_ASSERT( account != nullptr, unknown_account, "Unknown account ${n}", ("n",name) );
   return *account;
}

const account_object* database::find_account_by_name( const string& name )const
{
   const auto& idx = get_index_type<account_index>().indices().get<by_name>();
   auto itr = idx.find( name );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const token_object& database::get_token( token_id_type id )const
{
   const token_object* token = find( id );
   LOANCHAIN_ASSERT( token != nullptr, unknown_token, "Unknown token ${id}", ("id",id) );
   return *token;
}

const token_object* database::find_active_token( const string& symbol )const
{
   const auto& idx = get_index_type<token_index>().indices().get<by_symbol>();
   auto range = idx.equal_range( symbol );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      if( itr->active )
         return &*itr;
   }
   return nullptr;
}

const loan_object& database::get_loan( loan_id_type id )const
{
   const loan_object* loan = find( id );
   LOANCHAIN_ASSERT( loan != nullptr, unknown_loan, "Unknown loan ${id}", ("id",id) );
   return *loan;
}

loan_id_type database::get_next_loan_id()const
{
   return loan_id_type( get_index_type<loan_index>().get_next_id() );
}

const price_feed_object* database::find_price_feed( const string& name )const
{
   const auto& idx = get_index_type<price_feed_index>().indices().get<by_name>();
   auto itr = idx.find( name );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

} }
