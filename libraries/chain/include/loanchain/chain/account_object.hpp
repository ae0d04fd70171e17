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
    * @brief An account on the ledger
    * @ingroup object
    *
    * The balance of the native token is kept on the account itself; balances of fungible tokens
    * live in @ref account_balance_object.
    */
   class account_object : public abstract_object<account_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = account_object_type;

         string      name;
         amount_type native_balance;
         /// Sequence the next transaction signed by this account must carry
         uint32_t    next_sequence = 0;

         account_id_type get_id()const { return account_id_type( id ); }
   };

   /**
    * @brief Tracks the balance of a single account/fungible token pair
    * @ingroup object
    */
   class account_balance_object : public abstract_object<account_balance_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_account_balance_object_type;

         account_id_type owner;
         token_id_type   token;
         amount_type     balance;
   };

   struct by_name;

   using account_multi_index_type = multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member< account_object, string, &account_object::name > >
      >
   >;

   using account_index = generic_index<account_object, account_multi_index_type>;

   struct by_account_token;

   using account_balance_multi_index_type = multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_token>,
            composite_key< account_balance_object,
               member< account_balance_object, account_id_type, &account_balance_object::owner >,
               member< account_balance_object, token_id_type, &account_balance_object::token >
            >
         >
      >
   >;

   using account_balance_index = generic_index<account_balance_object, account_balance_multi_index_type>;

} } // loanchain::chain

MAP_OBJECT_ID_TO_TYPE( loanchain::chain::account_object )
MAP_OBJECT_ID_TO_TYPE( loanchain::chain::account_balance_object )

FC_REFLECT_DERIVED( loanchain::chain::account_object, (loanchain::db::object),
                    (name)(native_balance)(next_sequence) )
FC_REFLECT_DERIVED( loanchain::chain::account_balance_object, (loanchain::db::object),
                    (owner)(token)(balance) )
