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
#include <loanchain/chain/types.hpp>
#include <loanchain/db/generic_index.hpp>

namespace loanchain { namespace chain {

   /// Balances of the native token are kept on the account
   struct native_transfer {};

   /// Balances of a fungible token are kept in per-account balance objects
   struct fungible_transfer
   {
      string asset_ref;
   };

   /**
    *  How funds of a token move between accounts. Selected once from the token kind when the
    *  token is looked up; every balance change dispatches on it.
    */
   using transfer_strategy = fc::static_variant< native_transfer, fungible_transfer >;

   /**
    *  @brief an entry of the token registry
    *  @ingroup object
    *
    *  Tokens are never removed. Everything but @ref active is fixed at registration.
    */
   class token_object : public abstract_object<token_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = token_object_type;

         token_kind kind = token_kind::fungible;
         string     asset_ref;
         string     symbol;
         uint8_t    decimals = 0;
         bool       active = true;
         /// Name of the oracle feed quoting this token in USD
         string     price_feed;

         token_id_type     get_id()const { return token_id_type( id ); }
         transfer_strategy get_transfer_strategy()const;
   };

   struct by_symbol;

   using token_multi_index_type = multi_index_container<
      token_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_non_unique< tag<by_symbol>, member< token_object, string, &token_object::symbol > >
      >
   >;

   using token_index = generic_index<token_object, token_multi_index_type>;

} } // loanchain::chain

MAP_OBJECT_ID_TO_TYPE( loanchain::chain::token_object )

FC_REFLECT( loanchain::chain::native_transfer, )
FC_REFLECT( loanchain::chain::fungible_transfer, (asset_ref) )
FC_REFLECT_TYPENAME( loanchain::chain::transfer_strategy )

FC_REFLECT_DERIVED( loanchain::chain::token_object, (loanchain::db::object),
                    (kind)(asset_ref)(symbol)(decimals)(active)(price_feed) )
