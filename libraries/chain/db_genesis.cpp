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

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( !_initialized, "The ledger has already been initialized" );
   FC_ASSERT( genesis_state.initial_timestamp != time_point_sec(), "Must initialize genesis timestamp." );
   FC_ASSERT( !genesis_state.initial_accounts.empty(), "Cannot start a ledger without accounts." );
   genesis_state.initial_parameters.validate();

   _undo_db.disable();

   // Create accounts
   for( const auto& account : genesis_state.initial_accounts )
   {
      FC_ASSERT( account.name.size() >= LOANCHAIN_MIN_ACCOUNT_NAME_LENGTH
                 && account.name.size() <= LOANCHAIN_MAX_ACCOUNT_NAME_LENGTH,
                 "Invalid account name ${n}", ("n",account.name) );
      FC_ASSERT( find_account_by_name( account.name ) == nullptr, "Duplicate account ${n}", ("n",account.name) );
      FC_ASSERT( is_valid_amount( account.native_balance ) );
      create<account_object>( [&account]( account_object& a ) {
         a.name = account.name;
         a.native_balance = account.native_balance;
      });
   }
   const account_object* admin = find_account_by_name( genesis_state.admin_name );
   FC_ASSERT( admin != nullptr, "Administrator ${n} is not one of the initial accounts",
              ("n",genesis_state.admin_name) );
   const account_id_type admin_id = admin->get_id();

   // Register tokens, the first one becomes token 0
   bool has_native = false;
   for( const auto& token : genesis_state.initial_tokens )
   {
      token_register_operation op;
      op.admin = admin_id;
      op.kind = token.kind;
      op.asset_ref = token.asset_ref;
      op.symbol = token.symbol;
      op.decimals = token.decimals;
      op.price_feed = token.price_feed;
      op.validate();
      FC_ASSERT( find_active_token( token.symbol ) == nullptr, "Duplicate token ${s}", ("s",token.symbol) );
      if( token.kind == token_kind::native )
      {
         FC_ASSERT( !has_native, "Only one native token may be active" );
         has_native = true;
      }
      create<token_object>( [&op]( token_object& t ) {
         t.kind = op.kind;
         t.asset_ref = op.asset_ref;
         t.symbol = op.symbol;
         t.decimals = op.decimals;
         t.price_feed = op.price_feed;
      });
   }

   for( const auto& feed : genesis_state.initial_price_feeds )
   {
      FC_ASSERT( find_price_feed( feed.name ) == nullptr, "Duplicate price feed ${n}", ("n",feed.name) );
      FC_ASSERT( feed.decimals <= LOANCHAIN_MAX_PRICE_DECIMALS );
      create<price_feed_object>( [&]( price_feed_object& f ) {
         f.name = feed.name;
         f.price = feed.price;
         f.decimals = feed.decimals;
         f.updated_at = genesis_state.initial_timestamp;
         f.publisher = admin_id;
      });
   }

   for( const auto& balance : genesis_state.initial_balances )
   {
      const token_object* token = find_active_token( balance.token_symbol );
      FC_ASSERT( token != nullptr, "Unknown token ${s}", ("s",balance.token_symbol) );
      FC_ASSERT( is_valid_amount( balance.amount ) );
      add_balance( get_account_by_name( balance.owner_name ).get_id(), *token, balance.amount );
   }

   chain_parameters params = genesis_state.initial_parameters;
   for( const auto& producer : genesis_state.initial_feed_producers )
      params.feed_producers.insert( get_account_by_name( producer ).get_id() );
   if( genesis_state.initial_liquidator_name.valid() )
      params.designated_liquidator = get_account_by_name( *genesis_state.initial_liquidator_name ).get_id();

   create<global_property_object>( [&]( global_property_object& p ) {
      p.parameters = params;
      p.admin_account = admin_id;
      p.time = genesis_state.initial_timestamp;
   });

   _undo_db.enable();
   _initialized = true;

   ilog( "Ledger initialized at ${t} with ${a} accounts and ${n} tokens",
         ("t",genesis_state.initial_timestamp)("a",genesis_state.initial_accounts.size())
         ("n",genesis_state.initial_tokens.size()) );
} FC_CAPTURE_AND_RETHROW() }

} }
