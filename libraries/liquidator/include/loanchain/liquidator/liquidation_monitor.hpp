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

#include <loanchain/liquidator/ledger_client.hpp>
#include <loanchain/liquidator/retry_policy.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/thread/future.hpp>

#include <atomic>
#include <map>
#include <memory>

namespace loanchain { namespace liquidator {

   struct monitor_options
   {
      /// Name of the account that signs and pays for settlements
      std::string      liquidator_account;
      uint32_t         interval_seconds = 10;
      /// Number of loans scanned when the next loan id cannot be read
      uint32_t         scan_cap = 100;
      fc::microseconds confirm_timeout = fc::seconds( 30 );
      fc::microseconds reconnect_delay = fc::seconds( 5 );
      /// Symbol to whole tokens, a lower balance of the liquidator account is reported as low
      std::map<std::string, uint64_t> low_balance_thresholds;
   };

   /// What one monitoring cycle did
   struct cycle_report
   {
      /// The cycle did not run because another one was still in progress
      bool     skipped = false;
      /// The ledger could not be reached, the cycle ended early
      bool     disconnected = false;
      /// A settlement was not confirmed in time, later settlements were left to the next cycle
      bool     deferred = false;
      uint32_t scanned = 0;
      uint32_t liquidatable = 0;
      uint32_t time_only = 0;
      uint32_t settled = 0;
      uint32_t failed = 0;
   };

   struct liquidator_balance
   {
      token_id_type token;
      std::string   symbol;
      amount_type   balance;
      bool          low = false;
   };

   /// A read-only snapshot of the monitor and the liquidator account
   struct health_report
   {
      bool                       healthy = false;
      bool                       connected = false;
      bool                       running = false;
      bool                       cycle_in_progress = false;
      optional<time_point_sec>   head_time;
      optional<cycle_report>     last_cycle;
      vector<liquidator_balance> balances;
      optional<std::string>      error;
   };

   /**
    *  @brief periodically scans all loans and settles those that can be liquidated
    *
    *  Cycles run one at a time. @ref start schedules a tick every interval; a tick that fires while
    *  a cycle is still running is skipped. Settlements of one cycle are submitted one after another
    *  and each is confirmed before the next is built from a fresh sequence.
    */
   class liquidation_monitor
   {
      public:
         liquidation_monitor( std::shared_ptr<ledger_client> client, monitor_options options,
                              retry_policy retry, sleep_function sleep = default_sleep );
         ~liquidation_monitor();

         void start();
         void stop();
         bool is_running()const { return _running; }

         /// Runs one cycle now, or reports it as skipped if a cycle is in progress
         cycle_report tick();

         bool cycle_in_progress()const { return _cycle_in_progress.load(); }

         /**
          *  Reads the head time and the liquidator's balances of all active tokens without retries
          *  and without reconnecting. May run while a cycle is in progress.
          */
         health_report health_check();

         const monitor_options& options()const { return _options; }

      private:
         void schedule_next_tick();
         void tick_loop();

         /// Blocks until the client is connected or the monitor is stopped
         bool ensure_connected();
         void reconnect_if_needed();
         void connection_lost( const fc::exception& e );

         /// Runs @p call through the retry policy, reconnecting before an attempt if the connection is lost
         template<typename Call>
         auto read( const char* what, Call&& call ) -> decltype( call() );

         cycle_report run_cycle();
         account_id_type resolve_signer();
         uint64_t scan_bound();
         void process_loan( const loan_object& loan, account_id_type signer, time_point_sec now,
                            cycle_report& report );
         void settle( const loan_object& loan, account_id_type signer, cycle_report& report );

         std::shared_ptr<ledger_client> _client;
         monitor_options                _options;
         retry_policy                   _retry;
         sleep_function                 _sleep;

         std::atomic<bool>              _cycle_in_progress{ false };
         bool                           _running = false;
         bool                           _stop_requested = false;
         bool                           _outage_reported = false;
         optional<account_id_type>      _signer;
         optional<cycle_report>         _last_cycle;

         fc::future<void>               _tick_task;
         fc::future<void>               _cycle_task;
   };

} } // loanchain::liquidator

FC_REFLECT( loanchain::liquidator::monitor_options,
            (liquidator_account)(interval_seconds)(scan_cap)(confirm_timeout)(reconnect_delay)
            (low_balance_thresholds) )
FC_REFLECT( loanchain::liquidator::cycle_report,
            (skipped)(disconnected)(deferred)(scanned)(liquidatable)(time_only)(settled)(failed) )
FC_REFLECT( loanchain::liquidator::liquidator_balance, (token)(symbol)(balance)(low) )
FC_REFLECT( loanchain::liquidator::health_report,
            (healthy)(connected)(running)(cycle_in_progress)(head_time)(last_cycle)(balances)(error) )
