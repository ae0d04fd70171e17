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
    *  @brief A loan requested by a borrower and funded by any number of lenders
    *  @ingroup object
    *
    *  The borrower's collateral is escrowed from the moment the loan is requested until the loan
    *  reaches a terminal status. Loans are never removed.
    */
   class loan_object : public abstract_object<loan_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = loan_object_type;

         account_id_type borrower;
         token_id_type   loan_token;
         token_id_type   collateral_token;
         amount_type     principal;
         amount_type     collateral_amount;
         uint16_t        interest_rate_bps = 0;
         uint32_t        duration_seconds = 0;
         time_point_sec  created_at;
         time_point_sec  funded_at;
         time_point_sec  due_date;
         loan_status     status = loan_status::requested;
         amount_type     amount_funded;
         uint16_t        risk_score = 0;
         bool            collateral_claimed = false;

         amount_type     min_contribution;
         time_point_sec  funding_deadline;
         string          document_ref;
         time_point_sec  voting_deadline;
         /// Set once lenders holding a strict majority of the principal agreed on a choice
         optional<vote_choice> resolution;

         loan_id_type get_id()const { return loan_id_type( id ); }

         /// floor( principal * interest_rate_bps / 10000 )
         amount_type interest()const;
         amount_type total_due()const { return principal + interest(); }
         amount_type remaining_capacity()const { return principal - amount_funded; }

         bool is_terminal()const { return protocol::is_terminal( status ); }
         bool is_past_due( time_point_sec now )const;
         /// Whether a settlement may be attempted at @p now
         bool is_open_for_settlement( time_point_sec now )const;
   };

   /**
    *  @brief The amount one lender has put into one loan
    *  @ingroup object
    *
    *  Top-ups add to the same record. Contributions are ordered by id, which makes the lender who
    *  contributed first the first lender processed when distributing rounding remainders.
    */
   class loan_contribution_object : public abstract_object<loan_contribution_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = loan_contribution_object_type;

         loan_id_type    loan;
         account_id_type lender;
         amount_type     amount;
         time_point_sec  timestamp;
         bool            refunded = false;

         loan_contribution_id_type get_id()const { return loan_contribution_id_type( id ); }
   };

   /**
    *  @brief A lender's vote on how to resolve a defaulted loan
    *  @ingroup object
    *
    *  Votes exist only while their loan is voting.
    */
   class loan_vote_object : public abstract_object<loan_vote_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = loan_vote_object_type;

         loan_id_type    loan;
         account_id_type lender;
         vote_choice     choice = vote_choice::liquidate;
         amount_type     weight;
   };

   struct by_status;
   struct by_funding_deadline;
   struct by_due_date;
   struct by_borrower;

   using loan_multi_index_type = multi_index_container<
      loan_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_status>,
            composite_key< loan_object,
               member< loan_object, loan_status, &loan_object::status >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_funding_deadline>,
            composite_key< loan_object,
               member< loan_object, loan_status, &loan_object::status >,
               member< loan_object, time_point_sec, &loan_object::funding_deadline >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_due_date>,
            composite_key< loan_object,
               member< loan_object, loan_status, &loan_object::status >,
               member< loan_object, time_point_sec, &loan_object::due_date >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_borrower>,
            composite_key< loan_object,
               member< loan_object, account_id_type, &loan_object::borrower >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using loan_index = generic_index<loan_object, loan_multi_index_type>;

   struct by_loan_lender;
   struct by_loan;
   struct by_lender;

   using loan_contribution_multi_index_type = multi_index_container<
      loan_contribution_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_loan_lender>,
            composite_key< loan_contribution_object,
               member< loan_contribution_object, loan_id_type, &loan_contribution_object::loan >,
               member< loan_contribution_object, account_id_type, &loan_contribution_object::lender >
            >
         >,
         ordered_unique< tag<by_loan>,
            composite_key< loan_contribution_object,
               member< loan_contribution_object, loan_id_type, &loan_contribution_object::loan >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_lender>,
            composite_key< loan_contribution_object,
               member< loan_contribution_object, account_id_type, &loan_contribution_object::lender >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using loan_contribution_index = generic_index<loan_contribution_object, loan_contribution_multi_index_type>;

   using loan_vote_multi_index_type = multi_index_container<
      loan_vote_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_loan_lender>,
            composite_key< loan_vote_object,
               member< loan_vote_object, loan_id_type, &loan_vote_object::loan >,
               member< loan_vote_object, account_id_type, &loan_vote_object::lender >
            >
         >
      >
   >;

   using loan_vote_index = generic_index<loan_vote_object, loan_vote_multi_index_type>;

} } // loanchain::chain

MAP_OBJECT_ID_TO_TYPE( loanchain::chain::loan_object )
MAP_OBJECT_ID_TO_TYPE( loanchain::chain::loan_contribution_object )
MAP_OBJECT_ID_TO_TYPE( loanchain::chain::loan_vote_object )

FC_REFLECT_DERIVED( loanchain::chain::loan_object, (loanchain::db::object),
                    (borrower)(loan_token)(collateral_token)(principal)(collateral_amount)(interest_rate_bps)
                    (duration_seconds)(created_at)(funded_at)(due_date)(status)(amount_funded)(risk_score)
                    (collateral_claimed)(min_contribution)(funding_deadline)(document_ref)(voting_deadline)
                    (resolution) )
FC_REFLECT_DERIVED( loanchain::chain::loan_contribution_object, (loanchain::db::object),
                    (loan)(lender)(amount)(timestamp)(refunded) )
FC_REFLECT_DERIVED( loanchain::chain::loan_vote_object, (loanchain::db::object),
                    (loan)(lender)(choice)(weight) )
