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

void database::push_loan_event( const loan_object& loan, loan_event_type type )
{
   const auto& event = create<loan_event_object>( [&]( loan_event_object& e ) {
      e.loan = loan.get_id();
      e.type = type;
      e.time = head_time();
   });
   _pending_events.push_back( loan_event_id_type( event.id ) );
}

void database::discard_loan_events()
{
   _pending_events.clear();
}

void database::notify_loan_events()
{
   if( _pending_events.empty() )
      return;

   vector<loan_event_id_type> events;
   events.swap( _pending_events );
   for( const auto& id : events )
   {
      const loan_event_object* event = find( id );
      if( event == nullptr )
         continue;
      try {
         loan_event_applied( *event );
      } catch( const fc::exception& e ) {
         wlog( "Loan event handler failed on ${ev}: ${e}", ("ev",*event)("e",e.to_detail_string()) );
      }
   }
}

} }
