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
#pragma once
#include <loanchain/chain/global_property_object.hpp>
#include <loanchain/chain/types.hpp>

#include <string>
#include <vector>

namespace loanchain { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      string      name;
      amount_type native_balance;
   };
   struct initial_token_type {
      token_kind kind = token_kind::fungible;
      string     symbol;
      string     asset_ref;
      uint8_t    decimals = 0;
      string     price_feed;
   };
   struct initial_balance_type {
      /// Must correspond to one of the initial accounts
      string      owner_name;
      /// Must correspond to one of the initial tokens
      string      token_symbol;
      amount_type amount;
   };
   struct initial_price_feed_type {
      string      name;
      amount_type price;
      uint8_t     decimals = 8;
   };

   time_point_sec                   initial_timestamp;
   /// Must correspond to one of the initial accounts
   string                           admin_name;
   chain_parameters                 initial_parameters;
   vector<initial_account_type>     initial_accounts;
   /// The first token becomes token 0
   vector<initial_token_type>       initial_tokens;
   vector<initial_balance_type>     initial_balances;
   vector<initial_price_feed_type>  initial_price_feeds;
   vector<string>                   initial_feed_producers;
   optional<string>                 initial_liquidator_name;
};

} } // namespace loanchain::chain

FC_REFLECT( loanchain::chain::genesis_state_type::initial_account_type, (name)(native_balance) )
FC_REFLECT( loanchain::chain::genesis_state_type::initial_token_type,
            (kind)(symbol)(asset_ref)(decimals)(price_feed) )
FC_REFLECT( loanchain::chain::genesis_state_type::initial_balance_type, (owner_name)(token_symbol)(amount) )
FC_REFLECT( loanchain::chain::genesis_state_type::initial_price_feed_type, (name)(price)(decimals) )

FC_REFLECT( loanchain::chain::genesis_state_type,
            (initial_timestamp)(admin_name)(initial_parameters)(initial_accounts)(initial_tokens)
            (initial_balances)(initial_price_feeds)(initial_feed_producers)(initial_liquidator_name) )
