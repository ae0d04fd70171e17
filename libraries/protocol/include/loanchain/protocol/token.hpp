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
#include <loanchain/protocol/base.hpp>

namespace loanchain { namespace protocol {

   enum class token_kind : uint8_t
   {
      native   = 0, ///< the ledger's own currency, held directly on the account
      fungible = 1  ///< a token contract referenced by asset_ref
   };

   /**
    * @brief Registers a token which loans may be denominated or collateralized in
    * @ingroup operations
    *
    * Only the ledger administrator may register tokens. The new token is active.
    */
   struct token_register_operation : public base_operation
   {
      account_id_type admin;
      token_kind      kind = token_kind::fungible;
      string          asset_ref;     ///< Contract reference of a fungible token, empty for the native token
      string          symbol;
      uint8_t         decimals = 0;
      string          price_feed;    ///< Name of the oracle feed quoting this token in USD

      account_id_type acting_account()const { return admin; }
      void            validate()const;
   };

   /**
    * @brief Forbids new loans referencing a token
    * @ingroup operations
    *
    * Loans which already reference the token are not affected. Deactivating an inactive token
    * has no effect.
    */
   struct token_deactivate_operation : public base_operation
   {
      account_id_type admin;
      token_id_type   token;

      account_id_type acting_account()const { return admin; }
      void            validate()const {}
   };

   /**
    * @brief Publishes the latest USD quote of an oracle feed
    * @ingroup operations
    *
    * The quote carries the time the oracle observed it, which may lie in the past.
    * The price is a fixed-point number with @ref decimals decimals.
    */
   struct price_feed_publish_operation : public base_operation
   {
      account_id_type publisher;
      string          feed;
      amount_type     price;
      uint8_t         decimals = 8;
      time_point_sec  updated_at;

      account_id_type acting_account()const { return publisher; }
      void            validate()const;
   };

   bool is_valid_token_symbol( const string& symbol );

} } // loanchain::protocol

FC_REFLECT_ENUM( loanchain::protocol::token_kind, (native)(fungible) )

FC_REFLECT( loanchain::protocol::token_register_operation,
            (admin)(kind)(asset_ref)(symbol)(decimals)(price_feed) )
FC_REFLECT( loanchain::protocol::token_deactivate_operation, (admin)(token) )
FC_REFLECT( loanchain::protocol::price_feed_publish_operation,
            (publisher)(feed)(price)(decimals)(updated_at) )
