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

price_quote database_price_oracle::latest_quote( const string& feed )const
{
   const price_feed_object* obj = _db.find_price_feed( feed );
   LOANCHAIN_ASSERT( obj != nullptr, stale_quote, "Unknown price feed ${f}", ("f",feed) );
   price_quote quote;
   quote.price = obj->price;
   quote.decimals = obj->decimals;
   quote.updated_at = obj->updated_at;
   return quote;
}

vector<lender_share> database::get_lender_shares( const loan_object& loan )const
{
   vector<lender_share> result;
   const auto& idx = get_index_type<loan_contribution_index>().indices().get<by_loan>();
   auto itr = idx.lower_bound( boost::make_tuple( loan.get_id() ) );
   for( ; itr != idx.end() && itr->loan == loan.get_id(); ++itr )
      result.push_back( lender_share{ itr->lender, itr->amount } );
   return result;
}

vector<lender_payout> database::pay_lenders( const loan_object& loan, const token_object& token,
                                             const amount_type& total )
{ try {
   auto payouts = split_pro_rata( get_lender_shares( loan ), loan.principal, total );
   for( const auto& payout : payouts )
      add_balance( payout.lender, token, payout.amount );
   return payouts;
} FC_CAPTURE_AND_RETHROW( (loan.id)(token.symbol)(total) ) }

void database::remove_loan_votes( const loan_object& loan )
{
   const auto& idx = get_index_type<loan_vote_index>().indices().get<by_loan_lender>();
   auto itr = idx.lower_bound( boost::make_tuple( loan.get_id() ) );
   while( itr != idx.end() && itr->loan == loan.get_id() )
   {
      const loan_vote_object& vote = *itr;
      ++itr;
      remove( vote );
   }
}

amount_type database::get_vote_weight( const loan_object& loan, vote_choice choice )const
{
   amount_type weight = 0;
   const auto& idx = get_index_type<loan_vote_index>().indices().get<by_loan_lender>();
   auto itr = idx.lower_bound( boost::make_tuple( loan.get_id() ) );
   for( ; itr != idx.end() && itr->loan == loan.get_id(); ++itr )
   {
      if( itr->choice == choice )
         weight += itr->weight;
   }
   return weight;
}

usd_valuation database::get_usd_value( const token_object& token, const amount_type& raw_amount )const
{
   valuation_engine engine( *_price_oracle, get_chain_parameters().max_quote_age_seconds );
   return engine.usd_value( token, raw_amount, head_time() );
}

liquidation_verdict database::check_liquidation( const loan_object& loan )const
{
   optional<amount_type> loan_value;
   optional<amount_type> collateral_value;
   try {
      loan_value = get_usd_value( get_token( loan.loan_token ), loan.principal ).value;
      collateral_value = get_usd_value( get_token( loan.collateral_token ), loan.collateral_amount ).value;
   } catch( const stale_quote& e ) {
      wlog( "Cannot value loan ${id}, judging by due date only: ${e}", ("id",loan.id)("e",e.to_string()) );
   }
   return evaluate_liquidation( loan, loan_value, collateral_value, head_time() );
}

void database::set_price_oracle( std::shared_ptr<price_oracle> oracle )
{
   FC_ASSERT( oracle != nullptr );
   _price_oracle = std::move( oracle );
}

} }
