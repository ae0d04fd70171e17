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
#include <loanchain/liquidator/liquidation_monitor.hpp>
#include <loanchain/chain/liquidation.hpp>

#include <fc/thread/thread.hpp>


namespace loanchain { namespace liquidator {

namespace {

   struct cycle_guard
   {
      std::atomic<bool>& in_progress;
      ~cycle_guard() { in_progress = false; }
   };

}

liquidation_monitor::liquidation_monitor( std::shared_ptr<ledger_client> client, monitor_options options,
                                          retry_policy retry, sleep_function sleep )
   :_client( std::move( client ) ),
    _options( std::move( options ) ),
    _retry( std::move( retry ) ),
    _sleep( std::move( sleep ) )
{
   FC_ASSERT( _client != nullptr, "Liquidation monitor requires a ledger client" );
   FC_ASSERT( _sleep, "Liquidation monitor requires a sleep function" );
   FC_ASSERT( !_options.liquidator_account.empty(), "Liquidation monitor requires a liquidator account" );
   FC_ASSERT( _options.interval_seconds > 0, "Monitoring interval must be positive" );
   FC_ASSERT( _options.scan_cap > 0, "Scan cap must be positive" );
}

liquidation_monitor::~liquidation_monitor()
{
   stop();
}

void liquidation_monitor::start()
{
   FC_ASSERT( !_running, "Liquidation monitor is already running" );
   _running = true;
   _stop_requested = false;
   ilog( "Liquidation monitor started for ${a}, one cycle every ${s} seconds",
         ("a",_options.liquidator_account)("s",_options.interval_seconds) );
   schedule_next_tick();
}

void liquidation_monitor::stop()
{
   _stop_requested = true;
   if( !_running )
      return;
   _running = false;
   try
   {
      if( _tick_task.valid() )
         _tick_task.cancel_and_wait( __FUNCTION__ );
      if( _cycle_task.valid() )
         _cycle_task.cancel_and_wait( __FUNCTION__ );
   }
   catch( const fc::exception& e )
   {
      wlog( "Unexpected exception while stopping the liquidation monitor: ${e}", ("e",e.to_detail_string()) );
   }
   ilog( "Liquidation monitor stopped" );
}

void liquidation_monitor::schedule_next_tick()
{
   const fc::time_point next_tick = fc::time_point::now() + fc::seconds( _options.interval_seconds );
   _tick_task = fc::schedule( [this]{ tick_loop(); }, next_tick, "Liquidation Monitor Tick" );
}

void liquidation_monitor::tick_loop()
{
   if( !_running )
      return;
   if( _cycle_in_progress.load() )
      dlog( "Liquidation cycle still in progress, skipping tick" );
   else
      _cycle_task = fc::async( [this]{ tick(); }, "Liquidation Cycle" );
   schedule_next_tick();
}

cycle_report liquidation_monitor::tick()
{
   cycle_report report;
   bool idle = false;
   if( !_cycle_in_progress.compare_exchange_strong( idle, true ) )
   {
      dlog( "Liquidation cycle still in progress, skipping tick" );
      report.skipped = true;
      return report;
   }
   cycle_guard guard{ _cycle_in_progress };

   try
   {
      report = run_cycle();
   }
   catch( const fc::canceled_exception& )
   {
      throw;
   }
   catch( const fc::exception& e )
   {
      elog( "Liquidation cycle aborted: ${e}", ("e",e.to_detail_string()) );
      ++report.failed;
   }

   _last_cycle = report;
   if( report.settled > 0 || report.failed > 0 || report.deferred )
      ilog( "Liquidation cycle finished: ${r}", ("r",report) );
   else
      dlog( "Liquidation cycle finished: ${r}", ("r",report) );
   return report;
}

bool liquidation_monitor::ensure_connected()
{
   while( !_client->is_connected() )
   {
      if( _stop_requested )
         return false;
      try
      {
         _client->connect();
         if( _outage_reported )
            ilog( "Connection to the ledger restored" );
         _outage_reported = false;
         return true;
      }
      catch( const ledger_unavailable_exception& e )
      {
         connection_lost( e );
      }
      _sleep( _options.reconnect_delay );
   }
   return true;
}

void liquidation_monitor::reconnect_if_needed()
{
   if( _client->is_connected() )
      return;
   _client->connect();
   if( _outage_reported )
      ilog( "Connection to the ledger restored" );
   _outage_reported = false;
}

template<typename Call>
auto liquidation_monitor::read( const char* what, Call&& call ) -> decltype( call() )
{
   return _retry.run( what, _sleep, [this,&call] {
      reconnect_if_needed();
      return call();
   } );
}

void liquidation_monitor::connection_lost( const fc::exception& e )
{
   if( _outage_reported )
      return;
   _outage_reported = true;
   elog( "Ledger unavailable, retrying every ${s} seconds: ${e}",
         ("s",_options.reconnect_delay.to_seconds())("e",e.to_string()) );
}

account_id_type liquidation_monitor::resolve_signer()
{
   if( _signer.valid() )
      return *_signer;
   const optional<account_object> account = read( "get_account_by_name", [this] {
      return _client->get_account_by_name( _options.liquidator_account );
   } );
   FC_ASSERT( account.valid(), "Liquidator account ${a} does not exist", ("a",_options.liquidator_account) );
   _signer = account->get_id();
   return *_signer;
}

uint64_t liquidation_monitor::scan_bound()
{
   try
   {
      const loan_id_type next = read( "get_next_loan_id", [this] {
         return _client->get_next_loan_id();
      } );
      return next.instance.value;
   }
   catch( const ledger_unavailable_exception& )
   {
      throw;
   }
   catch( const fc::canceled_exception& )
   {
      throw;
   }
   catch( const fc::exception& e )
   {
      wlog( "Unable to read the next loan id, scanning up to ${c} loans: ${e}",
            ("c",_options.scan_cap)("e",e.to_string()) );
      return _options.scan_cap;
   }
}

cycle_report liquidation_monitor::run_cycle()
{
   cycle_report report;
   if( !ensure_connected() )
   {
      report.disconnected = true;
      return report;
   }

   try
   {
      const account_id_type signer = resolve_signer();
      const time_point_sec now = read( "get_head_time", [this] {
         return _client->get_head_time();
      } );
      const uint64_t bound = scan_bound();

      for( uint64_t i = 0; i < bound; ++i )
      {
         const loan_id_type id( i );
         try
         {
            const optional<loan_object> loan = read( "get_loan", [this,id] {
               return _client->get_loan( id );
            } );
            // loan 0 may be missing on a fresh ledger, past that the first gap is the end
            if( !loan.valid() )
            {
               if( i == 0 )
                  continue;
               break;
            }
            ++report.scanned;
            process_loan( *loan, signer, now, report );
         }
         catch( const ledger_unavailable_exception& )
         {
            throw;
         }
         catch( const fc::canceled_exception& )
         {
            throw;
         }
         catch( const fc::exception& e )
         {
            ++report.failed;
            wlog( "Processing loan ${id} failed: ${e}", ("id",id)("e",e.to_detail_string()) );
         }
      }
   }
   catch( const ledger_unavailable_exception& e )
   {
      report.disconnected = true;
      connection_lost( e );
   }
   return report;
}

void liquidation_monitor::process_loan( const loan_object& loan, account_id_type signer, time_point_sec now,
                                        cycle_report& report )
{
   if( loan.status != loan_status::active && loan.status != loan_status::voting )
      return;
   if( !loan.is_open_for_settlement( now ) )
      return;

   optional<amount_type> loan_value;
   optional<amount_type> collateral_value;
   try
   {
      loan_value = read( "get_usd_value", [&] {
         return _client->get_usd_value( loan.loan_token, loan.principal ).value;
      } );
      collateral_value = read( "get_usd_value", [&] {
         return _client->get_usd_value( loan.collateral_token, loan.collateral_amount ).value;
      } );
   }
   catch( const ledger_unavailable_exception& )
   {
      throw;
   }
   catch( const fc::canceled_exception& )
   {
      throw;
   }
   catch( const fc::exception& e )
   {
      wlog( "Unable to value loan ${id}, judging it by its due date: ${e}", ("id",loan.id)("e",e.to_string()) );
      loan_value.reset();
      collateral_value.reset();
   }

   const liquidation_verdict verdict = evaluate_liquidation( loan, loan_value, collateral_value, now );
   if( !verdict.valued )
      ++report.time_only;
   if( !verdict.liquidatable )
      return;

   ++report.liquidatable;
   if( report.deferred )
   {
      dlog( "Settlement of loan ${id} deferred to the next cycle", ("id",loan.id) );
      return;
   }
   ilog( "Loan ${id} is liquidatable: ${v}", ("id",loan.id)("v",verdict) );
   settle( loan, signer, report );
}

void liquidation_monitor::settle( const loan_object& loan, account_id_type signer, cycle_report& report )
{
   loan_liquidate_operation op;
   op.liquidator = signer;
   op.loan = loan.get_id();

   transaction trx;
   trx.signer = signer;
   trx.sequence = read( "get_next_sequence", [this,signer] {
      return _client->get_next_sequence( signer );
   } );
   trx.operations.emplace_back( op );

   try
   {
      _client->submit_and_wait( trx, _options.confirm_timeout );
      ++report.settled;
      ilog( "Settled loan ${id} with transaction ${n} of ${s}", ("id",op.loan)("n",trx.sequence)("s",signer) );
   }
   catch( const settlement_timeout_exception& e )
   {
      ++report.failed;
      report.deferred = true;
      wlog( "Settlement of loan ${id} not confirmed, deferring the rest of this cycle: ${e}",
            ("id",op.loan)("e",e.to_string()) );
   }
}

health_report liquidation_monitor::health_check()
{
   health_report report;
   report.running = _running;
   report.cycle_in_progress = cycle_in_progress();
   report.last_cycle = _last_cycle;
   report.connected = _client->is_connected();

   bool low_balance = false;
   if( report.connected )
   {
      try
      {
         report.head_time = _client->get_head_time();
         const optional<account_object> account = _client->get_account_by_name( _options.liquidator_account );
         FC_ASSERT( account.valid(), "Liquidator account ${a} does not exist", ("a",_options.liquidator_account) );

         for( const token_object& token : _client->list_tokens() )
         {
            if( !token.active )
               continue;
            liquidator_balance entry;
            entry.token = token.get_id();
            entry.symbol = token.symbol;
            entry.balance = _client->get_balance( account->get_id(), entry.token );
            auto threshold = _options.low_balance_thresholds.find( token.symbol );
            if( threshold != _options.low_balance_thresholds.end() )
               entry.low = entry.balance < amount_type( threshold->second ) * pow10( token.decimals );
            if( entry.low )
            {
               low_balance = true;
               wlog( "Liquidator ${a} is low on ${s}: ${b} of at least ${t} units",
                     ("a",_options.liquidator_account)("s",token.symbol)("b",entry.balance)
                     ("t",threshold->second) );
            }
            report.balances.push_back( entry );
         }
      }
      catch( const ledger_unavailable_exception& e )
      {
         report.connected = false;
         report.error = e.to_string();
      }
      catch( const fc::canceled_exception& )
      {
         throw;
      }
      catch( const fc::exception& e )
      {
         wlog( "Health check failed: ${e}", ("e",e.to_detail_string()) );
         report.error = e.to_string();
      }
   }

   report.healthy = report.connected && !report.error.valid() && !low_balance
                    && !( report.last_cycle.valid() && report.last_cycle->disconnected );
   return report;
}

} } // loanchain::liquidator
