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
#include <loanchain/chain/token_evaluator.hpp>

#include <loanchain/chain/database.hpp>
#include <loanchain/chain/exceptions.hpp>

namespace loanchain { namespace chain {

void_result token_register_evaluator::do_evaluate( const token_register_operation& op ) const
{ try {
   const database& d = db();

   LOANCHAIN_ASSERT( op.admin == d.get_global_properties().admin_account, token_register_unauthorized,
                     "Only the administrator may register tokens", ("admin",op.admin) );

   LOANCHAIN_ASSERT( d.find_active_token( op.symbol ) == nullptr, token_register_duplicate_symbol,
                     "Token id already active: ${s}", ("s",op.symbol) );

   if( op.kind == token_kind::native )
   {
      const auto& idx = d.get_index_type<token_index>().indices().get<by_id>();
      for( const auto& token : idx )
         LOANCHAIN_ASSERT( !( token.active && token.kind == token_kind::native ), token_register_duplicate_native,
                           "Native token ${s} is already active", ("s",token.symbol) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type token_register_evaluator::do_apply( const token_register_operation& op ) const
{ try {
   const auto& new_token = db().create<token_object>( [&op]( token_object& t ) {
      t.kind = op.kind;
      t.asset_ref = op.asset_ref;
      t.symbol = op.symbol;
      t.decimals = op.decimals;
      t.price_feed = op.price_feed;
      t.active = true;
   });
   ilog( "Registered token ${s} as ${id}", ("s",new_token.symbol)("id",new_token.id) );
   return new_token.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_deactivate_evaluator::do_evaluate( const token_deactivate_operation& op )
{ try {
   const database& d = db();

   LOANCHAIN_ASSERT( op.admin == d.get_global_properties().admin_account, token_deactivate_unauthorized,
                     "Only the administrator may deactivate tokens", ("admin",op.admin) );
   _token = &d.get_token( op.token );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_deactivate_evaluator::do_apply( const token_deactivate_operation& op ) const
{ try {
   if( _token->active )
   {
      db().modify( *_token, []( token_object& t ) {
         t.active = false;
      });
      ilog( "Deactivated token ${s}", ("s",_token->symbol) );
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result price_feed_publish_evaluator::do_evaluate( const price_feed_publish_operation& op )
{ try {
   const database& d = db();
   const auto& gpo = d.get_global_properties();

   LOANCHAIN_ASSERT( op.publisher == gpo.admin_account || gpo.parameters.feed_producers.count( op.publisher ) > 0,
                     price_feed_publish_unauthorized, "Account ${a} is not a feed producer", ("a",op.publisher) );
   LOANCHAIN_ASSERT( op.updated_at <= gpo.time, price_feed_publish_future_quote,
                     "Quote time ${u} is ahead of ledger time ${t}", ("u",op.updated_at)("t",gpo.time) );

   _feed = d.find_price_feed( op.feed );
   LOANCHAIN_ASSERT( _feed == nullptr || op.updated_at >= _feed->updated_at, price_feed_publish_outdated_quote,
                     "Quote time ${u} of ${f} is older than the current quote from ${c}",
                     ("u",op.updated_at)("f",op.feed)("c",_feed->updated_at) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type price_feed_publish_evaluator::do_apply( const price_feed_publish_operation& op ) const
{ try {
   database& d = db();

   if( _feed == nullptr )
   {
      return d.create<price_feed_object>( [&op]( price_feed_object& f ) {
         f.name = op.feed;
         f.price = op.price;
         f.decimals = op.decimals;
         f.updated_at = op.updated_at;
         f.publisher = op.publisher;
      }).id;
   }

   d.modify( *_feed, [&op]( price_feed_object& f ) {
      f.price = op.price;
      f.decimals = op.decimals;
      f.updated_at = op.updated_at;
      f.publisher = op.publisher;
   });
   return _feed->id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // loanchain::chain
