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

namespace detail {

   /// Reads the balance of one account according to the transfer strategy of a token
   struct balance_reader
   {
      using result_type = amount_type;

      const database&       db;
      const account_object& owner;
      token_id_type         token;

      amount_type operator()( const native_transfer& )const
      {
         return owner.native_balance;
      }

      amount_type operator()( const fungible_transfer& )const
      {
         const auto& idx = db.get_index_type<account_balance_index>().indices().get<by_account_token>();
         auto itr = idx.find( boost::make_tuple( owner.get_id(), token ) );
         if( itr == idx.end() )
            return amount_type( 0 );
         return itr->balance;
      }
   };

   /// Applies a balance change according to the transfer strategy of a token
   struct balance_adjuster
   {
      using result_type = void;

      database&             db;
      const account_object& owner;
      token_id_type         token;
      const amount_type&    amount;
      bool                  credit;

      void operator()( const native_transfer& )const
      {
         db.modify( owner, [this]( account_object& a ) {
            if( credit )
               a.native_balance += amount;
            else
               a.native_balance -= amount;
         });
      }

      void operator()( const fungible_transfer& )const
      {
         const auto& idx = db.get_index_type<account_balance_index>().indices().get<by_account_token>();
         auto itr = idx.find( boost::make_tuple( owner.get_id(), token ) );
         if( itr == idx.end() )
         {
            FC_ASSERT( credit, "Cannot debit a missing balance" );
            db.create<account_balance_object>( [this]( account_balance_object& b ) {
               b.owner = owner.get_id();
               b.token = token;
               b.balance = amount;
            });
            return;
         }
         db.modify( *itr, [this]( account_balance_object& b ) {
            if( credit )
               b.balance += amount;
            else
               b.balance -= amount;
         });
      }
   };

} // detail

amount_type database::get_balance( account_id_type owner, token_id_type token )const
{
   return get_balance( get_account( owner ), get_token( token ) );
}

amount_type database::get_balance( const account_object& owner, const token_object& token )const
{
   return token.get_transfer_strategy().visit( detail::balance_reader{ *this, owner, token.get_id() } );
}

void database::add_balance( account_id_type account, const token_object& token, const amount_type& amount )
{ try {
   if( amount == 0 )
      return;
   const account_object& owner = get_account( account );
   FC_ASSERT( is_valid_amount( get_balance( owner, token ) + amount ), "Balance overflow" );
   token.get_transfer_strategy().visit( detail::balance_adjuster{ *this, owner, token.get_id(), amount, true } );
} FC_CAPTURE_AND_RETHROW( (account)(token.symbol)(amount) ) }

void database::reduce_balance( account_id_type account, const token_object& token, const amount_type& amount )
{ try {
   if( amount == 0 )
      return;
   const account_object& owner = get_account( account );
   const amount_type available = get_balance( owner, token );
   LOANCHAIN_ASSERT( available >= amount, insufficient_balance,
                     "Insufficient Balance: ${a}'s balance of ${b} ${s} is less than required ${r}",
                     ("a",owner.name)("b",available)("s",token.symbol)("r",amount) );
   token.get_transfer_strategy().visit( detail::balance_adjuster{ *this, owner, token.get_id(), amount, false } );
} FC_CAPTURE_AND_RETHROW( (account)(token.symbol)(amount) ) }

} }
