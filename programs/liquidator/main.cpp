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
#include <loanchain/liquidator/remote_ledger_client.hpp>
#include <loanchain/protocol/config.hpp>

#include <fc/interprocess/signals.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include <functional>
#include <iostream>

#ifdef WIN32
# include <signal.h>
#else
# include <csignal>
#endif

using namespace loanchain::liquidator;
using namespace std;
namespace bpo = boost::program_options;

fc::log_level string_to_level(string level)
{
   fc::log_level result;
   if(level == "info")
      result = fc::log_level::info;
   else if(level == "debug")
      result = fc::log_level::debug;
   else if(level == "warn")
      result = fc::log_level::warn;
   else if(level == "error")
      result = fc::log_level::error;
   else if(level == "all")
      result = fc::log_level::all;
   else
      FC_THROW("Log level not allowed. Allowed levels are info, debug, warn, error and all.");

   return result;
}

void setup_logging(string console_level, bool file_logger, string file_level, const fc::path& file_name)
{
   fc::logging_config cfg;

   // console logger
   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::debug,
         fc::console_appender::color::green));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::warn,
         fc::console_appender::color::brown));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::error,
         fc::console_appender::color::red));
   cfg.appenders.push_back(fc::appender_config( "default", "console", fc::variant(console_appender_config, 20)));
   cfg.loggers = { fc::logger_config("default") };
   cfg.loggers.front().level = string_to_level(console_level);
   cfg.loggers.front().appenders = {"default"};

   // file logger, same messages as the console
   if(file_logger) {
      fc::file_appender::config ac;
      ac.filename             = file_name;
      ac.flush                = true;
      ac.rotate               = true;
      ac.rotation_interval    = fc::hours( 1 );
      ac.rotation_limit       = fc::days( 7 );
      cfg.appenders.push_back(fc::appender_config( "file", "file", fc::variant(ac, 5)));
      cfg.loggers.front().appenders.push_back("file");
      // the logger passes a message on only if its level allows it for every appender
      if( string_to_level(file_level) < cfg.loggers.front().level )
         cfg.loggers.front().level = string_to_level(file_level);
   }
   fc::configure_logging( cfg );
   if(file_logger)
      ilog ("Logging to file: " + file_name.preferred_string());
}

int main( int argc, char** argv )
{
   try {

      boost::program_options::options_description opts;
         opts.add_options()
         ("help,h", "Print this help message and exit.")
         ("server-rpc-endpoint,s", bpo::value<string>()->default_value("ws://127.0.0.1:8090"),
               "Websocket RPC endpoint of the ledger node")
         ("liquidator-account,a", bpo::value<string>(), "Account that signs and pays for settlements")
         ("interval", bpo::value<uint32_t>()->default_value(10), "Seconds between two liquidation cycles")
         ("scan-cap", bpo::value<uint32_t>()->default_value(100),
               "Number of loans scanned per cycle if the loan count cannot be read")
         ("confirm-timeout", bpo::value<uint32_t>()->default_value(30),
               "Seconds to wait for a settlement to be confirmed")
         ("retry-attempts", bpo::value<uint32_t>()->default_value(3), "Attempts per ledger read")
         ("retry-delay", bpo::value<uint32_t>()->default_value(1000),
               "Milliseconds between two attempts of a ledger read")
         ("reconnect-delay", bpo::value<uint32_t>()->default_value(5),
               "Seconds between two attempts to reconnect to the ledger")
         ("read-timeout", bpo::value<uint32_t>()->default_value(30),
               "Seconds to wait for the answer to a ledger read before reconnecting")
         ("low-balance", bpo::value<vector<string>>()->composing(),
               "Warn if the liquidator holds less than this of a token, as SYMBOL=WHOLE_TOKENS (may specify multiple times)")
         ("health-interval", bpo::value<uint32_t>()->default_value(60),
               "Seconds between two logged health checks, 0 to disable")
         ("health-check", "Connect, print one health report and exit with 0 if healthy")
         ("logs-level", bpo::value<string>()->default_value("info"),
               "Level of console logging. Allowed levels: info, debug, warn, error, all")
         ("file-logs", bpo::value<bool>()->default_value(false), "Also write log messages to a file")
         ("file-logs-level", bpo::value<string>()->default_value("debug"),
               "Level of file logging. Allowed levels: info, debug, warn, error, all")
         ("file-logs-name", bpo::value<boost::filesystem::path>()->default_value("liquidator_logs/liquidator.log"),
               "File name for file logs")
         ;

      bpo::variables_map options;

      bpo::store( bpo::parse_command_line(argc, argv, opts), options );

      if( options.count("help") )
      {
         std::cout << opts << "\n";
         return 0;
      }
      if( !options.count("liquidator-account") )
      {
         std::cerr << "Missing required option --liquidator-account\n";
         return 1;
      }

      fc::path file_name = options.at("file-logs-name").as<boost::filesystem::path>();
      setup_logging( options.at("logs-level").as<string>(), options.at("file-logs").as<bool>(),
                     options.at("file-logs-level").as<string>(), file_name );

      monitor_options mopts;
      mopts.liquidator_account = options.at("liquidator-account").as<string>();
      mopts.interval_seconds = options.at("interval").as<uint32_t>();
      mopts.scan_cap = options.at("scan-cap").as<uint32_t>();
      mopts.confirm_timeout = fc::seconds( options.at("confirm-timeout").as<uint32_t>() );
      mopts.reconnect_delay = fc::seconds( options.at("reconnect-delay").as<uint32_t>() );
      if( options.count("low-balance") )
      {
         for( const string& entry : options.at("low-balance").as<vector<string>>() )
         {
            const auto pos = entry.find( '=' );
            FC_ASSERT( pos != string::npos && pos > 0, "Invalid low-balance ${e}, expected SYMBOL=WHOLE_TOKENS",
                       ("e",entry) );
            try
            {
               mopts.low_balance_thresholds[entry.substr( 0, pos )] = boost::lexical_cast<uint64_t>( entry.substr( pos + 1 ) );
            }
            catch( const boost::bad_lexical_cast& )
            {
               FC_THROW( "Invalid amount in low-balance ${e}", ("e",entry) );
            }
         }
      }

      const auto retry = retry_policy::fixed( options.at("retry-attempts").as<uint32_t>(),
                                              fc::milliseconds( options.at("retry-delay").as<uint32_t>() ) );

      const string endpoint = options.at("server-rpc-endpoint").as<string>();
      idump((endpoint)(mopts));
      auto client = std::make_shared<remote_ledger_client>( endpoint,
                                                            fc::seconds( options.at("read-timeout").as<uint32_t>() ) );
      auto monitor = std::make_shared<liquidation_monitor>( client, mopts, retry );

      if( options.count("health-check") )
      {
         client->connect();
         const health_report health = monitor->health_check();
         std::cout << fc::json::to_pretty_string( fc::variant( health, LOANCHAIN_MAX_NESTED_OBJECTS ) ) << "\n";
         client->disconnect();
         return health.healthy ? 0 : 1;
      }

      fc::promise<int>::ptr exit_promise = fc::promise<int>::create("UNIX Signal Handler");

      fc::set_signal_handler( [&exit_promise](int signal) {
         ilog( "Captured SIGINT, exiting" );
         exit_promise->set_value(signal);
      }, SIGINT );

      fc::set_signal_handler( [&exit_promise](int signal) {
         ilog( "Captured SIGTERM, exiting" );
         exit_promise->set_value(signal);
      }, SIGTERM );
#ifdef SIGQUIT
      fc::set_signal_handler( [&exit_promise](int signal) {
         ilog( "Captured SIGQUIT, exiting" );
         exit_promise->set_value(signal);
      }, SIGQUIT );
#endif

      monitor->start();

      const uint32_t health_interval = options.at("health-interval").as<uint32_t>();
      fc::future<void> health_task;
      std::function<void()> log_health = [&]() {
         const health_report health = monitor->health_check();
         if( health.healthy )
            ilog( "Liquidator healthy: ${h}", ("h",health) );
         else
            wlog( "Liquidator unhealthy: ${h}", ("h",health) );
         health_task = fc::schedule( log_health, fc::time_point::now() + fc::seconds( health_interval ),
                                     "Liquidator Health Check" );
      };
      if( health_interval > 0 )
         health_task = fc::schedule( log_health, fc::time_point::now() + fc::seconds( health_interval ),
                                     "Liquidator Health Check" );

      ilog( "Entering liquidation loop, press Ctrl-C to exit" );
      exit_promise->wait();

      if( health_task.valid() )
         health_task.cancel_and_wait( __FUNCTION__ );
      monitor->stop();
      client->disconnect();
   }
   catch ( const fc::exception& e )
   {
      std::cout << e.to_detail_string() << "\n";
      return -1;
   }
   return 0;
}
