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

void database::perform_loan_maintenance()
{
   expire_unfunded_loans();
   default_overdue_loans();
}

void database::expire_unfunded_loans()
{ try {
   const auto now = head_time();
   const auto& idx = get_index_type<loan_index>().indices().get<by_funding_deadline>();

   // Expiring a loan moves it out of the requested range, so always look at the front
   auto itr = idx.lower_bound( boost::make_tuple( loan_status::requested ) );
   while( itr != idx.end() && itr->status == loan_status::requested && itr->funding_deadline < now )
   {
      const loan_object& loan = *itr;
      dlog( "Loan ${id} expired with ${f} of ${p} funded",
            ("id",loan.id)("f",loan.amount_funded)("p",loan.principal) );

      add_balance( loan.borrower, get_token( loan.collateral_token ), loan.collateral_amount );
      modify( loan, []( loan_object& l ) {
         l.status = loan_status::expired;
      });
      push_loan_event( loan, loan_event_type::expired );

      itr = idx.lower_bound( boost::make_tuple( loan_status::requested ) );
   }
} FC_CAPTURE_AND_RETHROW() }

void database::default_overdue_loans()
{ try {
   const auto now = head_time();
   const auto& params = get_chain_parameters();
   const auto& idx = get_index_type<loan_index>().indices().get<by_due_date>();

   auto itr = idx.lower_bound( boost::make_tuple( loan_status::active ) );
   while( itr != idx.end() && itr->status == loan_status::active && itr->is_past_due( now ) )
   {
      const loan_object& loan = *itr;
      ilog( "Loan ${id} defaulted, due ${d}", ("id",loan.id)("d",loan.due_date) );

      modify( loan, []( loan_object& l ) {
         l.status = loan_status::past_due;
      });
      push_loan_event( loan, loan_event_type::defaulted );

      modify( loan, [now,&params]( loan_object& l ) {
         l.status = loan_status::voting;
         l.voting_deadline = now + params.voting_period_seconds;
      });

      itr = idx.lower_bound( boost::make_tuple( loan_status::active ) );
   }
} FC_CAPTURE_AND_RETHROW() }

} }
