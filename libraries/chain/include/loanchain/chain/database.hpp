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
#include <loanchain/chain/account_object.hpp>
#include <loanchain/chain/evaluator.hpp>
#include <loanchain/chain/genesis_state.hpp>
#include <loanchain/chain/global_property_object.hpp>
#include <loanchain/chain/liquidation.hpp>
#include <loanchain/chain/loan_accounting.hpp>
#include <loanchain/chain/loan_event_object.hpp>
#include <loanchain/chain/loan_object.hpp>
#include <loanchain/chain/price_feed_object.hpp>
#include <loanchain/chain/token_object.hpp>
#include <loanchain/chain/valuation.hpp>

#include <loanchain/db/object_database.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

#include <memory>

namespace loanchain { namespace chain {
   class database;

   /**
    *  @brief reads quotes from the price feed objects stored on the ledger
    *
    *  An unknown feed is reported as @ref stale_quote.
    */
   class database_price_oracle : public price_oracle
   {
      public:
         explicit database_price_oracle( const database& db ):_db(db){}
         price_quote latest_quote( const string& feed )const override;
      private:
         const database& _db;
   };

   /**
    *   @class database
    *   @brief tracks the state of the loan ledger
    *
    *   The database is the only writer of ledger state. Changes are made by pushing transactions
    *   and by advancing ledger time; both are atomic.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Creates the initial ledger state
          *
          * May only be called once, on an empty database.
          */
         void init_genesis( const genesis_state_type& genesis_state );

         /// Discards all in-flight undo state and pending events
         void close();

         bool is_initialized()const { return _initialized; }

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object& get_global_properties()const;
         const chain_parameters&       get_chain_parameters()const;
         time_point_sec                head_time()const;

         const account_object&    get_account( account_id_type id )const;
         const account_object&    get_account_by_name( const string& name )const;
         const account_object*    find_account_by_name( const string& name )const;

         const token_object&      get_token( token_id_type id )const;
         /// The active token with the given symbol, if any
         const token_object*      find_active_token( const string& symbol )const;

         const loan_object&       get_loan( loan_id_type id )const;
         /// The id the next requested loan will get
         loan_id_type             get_next_loan_id()const;

         const price_feed_object* find_price_feed( const string& name )const;

         //////////////////// db_init.cpp ////////////////////

         void initialize_indexes();
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0 && static_cast<size_t>(op_type) < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's balance in a given token
          * @return owner's balance in the token, zero if the account never held it
          */
         amount_type get_balance( account_id_type owner, token_id_type token )const;
         amount_type get_balance( const account_object& owner, const token_object& token )const;

         /**
          * @brief Credit @p amount of @p token to @p account
          */
         void add_balance( account_id_type account, const token_object& token, const amount_type& amount );

         /**
          * @brief Debit @p amount of @p token from @p account
          * @throws insufficient_balance if the account does not hold enough
          */
         void reduce_balance( account_id_type account, const token_object& token, const amount_type& amount );

         //////////////////// db_loan.cpp ////////////////////

         /// Contributions to @p loan in the order lenders are processed
         vector<lender_share> get_lender_shares( const loan_object& loan )const;

         /**
          * @brief Pays @p total of @p token to the lenders of @p loan pro rata
          *
          * The first lender also receives what rounding leaves over.
          */
         vector<lender_payout> pay_lenders( const loan_object& loan, const token_object& token,
                                            const amount_type& total );

         /// Removes every vote cast on @p loan
         void remove_loan_votes( const loan_object& loan );

         /// Sum of the vote weights for @p choice on @p loan
         amount_type get_vote_weight( const loan_object& loan, vote_choice choice )const;

         /// @throws stale_quote
         usd_valuation get_usd_value( const token_object& token, const amount_type& raw_amount )const;

         /**
          * @brief Runs the liquidation decision on ledger quotes
          *
          * A loan whose principal or collateral cannot be valued is judged by its due date alone.
          */
         liquidation_verdict check_liquidation( const loan_object& loan )const;

         /// Replaces the source of quotes, the default reads price feed objects
         void set_price_oracle( std::shared_ptr<price_oracle> oracle );
         const price_oracle& get_price_oracle()const { return *_price_oracle; }

         //////////////////// db_block.cpp ////////////////////

         /**
          * @brief Applies a transaction atomically
          *
          * Either every operation of @p trx takes effect or none does. Events produced by the
          * transaction are published once it is committed.
          */
         processed_transaction push_transaction( const transaction& trx );

         /**
          * @brief Moves ledger time to @p new_time and runs deadline maintenance
          *
          * Unfunded loans whose funding deadline passed expire; active loans whose due date passed
          * default and go to vote.
          */
         void advance_time( time_point_sec new_time );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

      private:
         processed_transaction _apply_transaction( const transaction& trx );

         //////////////////// db_update.cpp ////////////////////

         void perform_loan_maintenance();
         void expire_unfunded_loans();
         void default_overdue_loans();

         //////////////////// db_notify.cpp ////////////////////

      public:
         /// Records a lifecycle event of @p loan, it is published when the current work commits
         void push_loan_event( const loan_object& loan, loan_event_type type );

         /**
          *  Emitted for every loan event once the transaction or maintenance pass that produced
          *  it has been committed. The callback should not yield and should execute quickly.
          */
         fc::signal<void(const loan_event_object&)> loan_event_applied;

      private:
         void notify_loan_events();
         void discard_loan_events();

         vector<unique_ptr<op_evaluator>> _operation_evaluators;
         vector<loan_event_id_type>       _pending_events;
         std::shared_ptr<price_oracle>    _price_oracle;
         bool                             _initialized = false;
   };

} }
