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

   /**
    *  @brief the latest quote of an oracle price feed
    *  @ingroup object
    *
    *  @ref price is the USD price of one whole token, a fixed-point number with
    *  @ref decimals decimals. @ref updated_at is the time the oracle observed the quote.
    */
   class price_feed_object : public abstract_object<price_feed_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = price_feed_object_type;

         string          name;
         amount_type     price;
         uint8_t         decimals = 0;
         time_point_sec  updated_at;
         account_id_type publisher;
   };

   struct by_name;

   using price_feed_multi_index_type = multi_index_container<
      price_feed_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member< price_feed_object, string, &price_feed_object::name > >
      >
   >;

   using price_feed_index = generic_index<price_feed_object, price_feed_multi_index_type>;

} } // loanchain::chain

MAP_OBJECT_ID_TO_TYPE( loanchain::chain::price_feed_object )

FC_REFLECT_DERIVED( loanchain::chain::price_feed_object, (loanchain::db::object),
                    (name)(price)(decimals)(updated_at)(publisher) )
