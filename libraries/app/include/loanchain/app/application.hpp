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

#include <loanchain/chain/database.hpp>

#include <boost/program_options.hpp>

namespace loanchain { namespace app {
   namespace detail { class application_impl; }
   using std::string;

   /**
    * @brief a ledger node
    *
    * Owns the ledger, serves the @ref ledger_api over websocket RPC and moves ledger time along
    * with the wall clock.
    */
   class application
   {
      public:
         application();
         ~application();

         void set_program_options( boost::program_options::options_description& command_line_options,
                                   boost::program_options::options_description& configuration_file_options )const;
         void initialize( const fc::path& data_dir,
                          std::shared_ptr<boost::program_options::variables_map> options )const;
         void startup();
         void shutdown();

         std::shared_ptr<chain::database> chain_database()const;

      private:
         std::shared_ptr<detail::application_impl> my;
   };

   /// A small ledger with one native and one dollar-pegged token, used when no genesis file is given
   chain::genesis_state_type create_example_genesis();

} }
