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

   enum class loan_event_type : uint8_t
   {
      requested         = 0,
      fully_funded      = 1,
      repaid            = 2,
      defaulted         = 3,
      liquidated        = 4,
      expired           = 5,
      partially_claimed = 6
   };

   /**
    *  @brief records a lifecycle event of a loan
    *  @ingroup object
    *  @ingroup implementation
    *
    *  Events are published through database::loan_event_applied once the work that produced them
    *  has been committed. Delivery to consumers is not tracked.
    */
   class loan_event_object : public abstract_object<loan_event_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_loan_event_object_type;

         loan_id_type    loan;
         loan_event_type type = loan_event_type::requested;
         time_point_sec  time;
   };

   struct by_loan;

   using loan_event_multi_index_type = multi_index_container<
      loan_event_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_loan>,
            composite_key< loan_event_object,
               member< loan_event_object, loan_id_type, &loan_event_object::loan >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using loan_event_index = generic_index<loan_event_object, loan_event_multi_index_type>;

} } // loanchain::chain

MAP_OBJECT_ID_TO_TYPE( loanchain::chain::loan_event_object )

FC_REFLECT_ENUM( loanchain::chain::loan_event_type,
                 (requested)(fully_funded)(repaid)(defaulted)(liquidated)(expired)(partially_claimed) )
FC_REFLECT_DERIVED( loanchain::chain::loan_event_object, (loanchain::db::object), (loan)(type)(time) )
