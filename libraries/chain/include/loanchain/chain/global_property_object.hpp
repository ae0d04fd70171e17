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

   struct chain_parameters
   {
      uint32_t                  max_quote_age_seconds     = LOANCHAIN_DEFAULT_MAX_QUOTE_AGE;
      uint32_t                  voting_period_seconds     = LOANCHAIN_DEFAULT_VOTING_PERIOD;
      uint16_t                  initial_collateral_percent = LOANCHAIN_DEFAULT_INITIAL_COLLATERAL_PERCENT; ///< 0 disables the check
      uint16_t                  max_interest_rate_bps     = LOANCHAIN_DEFAULT_MAX_INTEREST_RATE_BPS;
      optional<account_id_type> designated_liquidator;    ///< If set, the only account allowed to settle loans
      flat_set<account_id_type> feed_producers;           ///< Accounts besides the administrator allowed to publish quotes

      void validate()const;
   };

   /**
    * @class global_property_object
    * @brief Maintains global state information
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one instance, created at genesis.
    */
   class global_property_object : public abstract_object<global_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_global_property_object_type;

         chain_parameters parameters;
         account_id_type  admin_account;
         time_point_sec   time;           ///< Current ledger time
   };

   using global_property_index = db::sparse_index<global_property_object>;

} } // loanchain::chain

MAP_OBJECT_ID_TO_TYPE( loanchain::chain::global_property_object )

FC_REFLECT( loanchain::chain::chain_parameters,
            (max_quote_age_seconds)(voting_period_seconds)(initial_collateral_percent)(max_interest_rate_bps)
            (designated_liquidator)(feed_producers) )
FC_REFLECT_DERIVED( loanchain::chain::global_property_object, (loanchain::db::object),
                    (parameters)(admin_account)(time) )
