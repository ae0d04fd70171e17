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
#include <loanchain/app/application.hpp>
#include <loanchain/liquidator/database_ledger_client.hpp>
#include <loanchain/liquidator/liquidation_monitor.hpp>

#include <fc/thread/thread.hpp>
#include <fc/interprocess/signals.hpp>
#include <fc/stacktrace.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/version.hpp>

#include <openssl/opensslv.h>
#include <websocketpp/version.hpp>

#include <fstream>
#include <sstream>

#ifdef WIN32
# include <signal.h>
#else
# include <csignal>
#endif

namespace bpo = boost::program_options;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

/// Log messages to console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

/// Writes every configuration file option with its default value, or commented out if it has none
static void create_new_config_file( const fc::path& config_ini_path, const fc::path& data_dir,
                                    const bpo::options_description& cfg_options )
{
   ilog("Writing new config file at ${path}", ("path", config_ini_path));
   if( !fc::exists(data_dir) )
      fc::create_directories(data_dir);

   std::ofstream out_cfg( config_ini_path.preferred_string() );
   for( const boost::shared_ptr<bpo::option_description>& od : cfg_options.options() )
   {
      if( !od->description().empty() )
         out_cfg << "# " << od->description() << "\n";
      boost::any store;
      if( !od->semantic()->apply_default(store) )
         out_cfg << "# " << od->long_name() << " = \n";
      else
      {
         auto example = od->format_parameter();
         if( example.empty() )
            out_cfg << od->long_name() << " = false\n";
         else
         {
            // the string is formatted "arg (=<default>)"
            example.erase(0, 6);
            example.erase(example.length()-1);
            out_cfg << od->long_name() << " = " << example << "\n";
         }
      }
      out_cfg << "\n";
   }
   out_cfg.close();
}

static void load_configuration_options( const fc::path& data_dir, const bpo::options_description& cfg_options,
                                        bpo::variables_map& options )
{
   const auto config_ini_path = data_dir / "config.ini";
   if( !fc::exists(config_ini_path) )
      create_new_config_file( config_ini_path, data_dir, cfg_options );

   bpo::store( bpo::parse_config_file<char>( config_ini_path.preferred_string().c_str(), cfg_options, true ),
               options );
}

/// The main program
int main(int argc, char** argv) {
   fc::print_stacktrace_on_segfault();
   auto node = std::make_unique<loanchain::app::application>();
   std::unique_ptr<loanchain::liquidator::liquidation_monitor> monitor;
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("Loan Ledger Node");
      bpo::options_description cfg_options("Loan Ledger Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value("loan_node_data_dir"),
                    "Directory containing the configuration file")
            ("version,v", "Display version information");

      auto sharable_options = std::make_shared<bpo::variables_map>();
      auto& options = *sharable_options;

      bpo::options_description monitor_options;
      monitor_options.add_options()
            ("liquidator-account", bpo::value<std::string>(),
                    "Run a liquidation monitor inside the node, settling loans on behalf of this account")
            ("liquidator-interval", bpo::value<uint32_t>()->default_value(10),
                    "Seconds between two liquidation cycles of the in-process monitor")
            ("liquidator-scan-cap", bpo::value<uint32_t>()->default_value(100),
                    "Number of loans the in-process monitor scans when the next loan id cannot be read");

      try
      {
         bpo::options_description cli;
         bpo::options_description cfg;
         node->set_program_options(cli, cfg);
         cfg.add(monitor_options);
         cli.add(monitor_options);
         app_options.add(cli);
         cfg_options.add(cfg);
         bpo::store(bpo::parse_command_line(argc, argv, app_options), options);
      }
      catch (const boost::program_options::error& e)
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("version") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "SSL: " << OPENSSL_VERSION_TEXT << "\n";
         ss << "Boost: " << boost::replace_all_copy(std::string(BOOST_LIB_VERSION), "_", ".") << "\n";
         ss << "Websocket++: " << websocketpp::major_version << "." << websocketpp::minor_version
                                      << "." << websocketpp::patch_version;
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }
      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      fc::path data_dir;
      if( options.count("data-dir") > 0 )
      {
         data_dir = options["data-dir"].as<boost::filesystem::path>();
         if( data_dir.is_relative() )
            data_dir = fc::current_path() / data_dir;
      }
      load_configuration_options(data_dir, cfg_options, options);

      bpo::notify(options);

      node->initialize(data_dir, sharable_options);

      node->startup();

      if( options.count("liquidator-account") > 0 )
      {
         loanchain::liquidator::monitor_options opts;
         opts.liquidator_account = options.at("liquidator-account").as<std::string>();
         opts.interval_seconds = options.at("liquidator-interval").as<uint32_t>();
         opts.scan_cap = options.at("liquidator-scan-cap").as<uint32_t>();
         auto client = std::make_shared<loanchain::liquidator::database_ledger_client>( *node->chain_database() );
         monitor = std::make_unique<loanchain::liquidator::liquidation_monitor>(
               client, opts, loanchain::liquidator::retry_policy::fixed( 1, fc::microseconds(0) ) );
         monitor->start();
      }

      fc::promise<int>::ptr exit_promise = fc::promise<int>::create("UNIX Signal Handler");

      fc::set_signal_handler([&exit_promise](int the_signal) {
         wlog( "Caught SIGINT, attempting to exit cleanly" );
         exit_promise->set_value(the_signal);
      }, SIGINT);

      fc::set_signal_handler([&exit_promise](int the_signal) {
         wlog( "Caught SIGTERM, attempting to exit cleanly" );
         exit_promise->set_value(the_signal);
      }, SIGTERM);

#ifdef SIGQUIT
      fc::set_signal_handler( [&exit_promise](int the_signal) {
         wlog( "Caught SIGQUIT, attempting to exit cleanly" );
         exit_promise->set_value(the_signal);
      }, SIGQUIT );
#endif

      ilog("Started loan ledger node at ledger time ${t}", ("t", node->chain_database()->head_time()));

      auto caught_signal = exit_promise->wait();
      ilog("Exiting from signal ${n}", ("n", caught_signal));
      if( monitor )
         monitor->stop();
      node->shutdown();
      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      // stopping the monitor and the node can yield, so do this outside the exception handler
      unhandled_exception = e;
   }

   if (unhandled_exception)
   {
      elog("Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()));
      if( monitor )
         monitor->stop();
      node->shutdown();
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
