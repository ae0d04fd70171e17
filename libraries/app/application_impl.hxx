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

#include <loanchain/app/application.hpp>

#include <fc/network/http/websocket.hpp>
#include <fc/thread/future.hpp>

namespace loanchain { namespace app { namespace detail {

class application_impl
{
   public:
      explicit application_impl( application* self )
         : _self(self),
           _chain_db(std::make_shared<chain::database>())
      {
      }

      ~application_impl()
      {
         shutdown();
      }

      void startup();
      void shutdown();

      void reset_websocket_server();

      void schedule_clock_loop();
      void clock_loop();

      application* _self;

      fc::path _data_dir;
      std::shared_ptr<boost::program_options::variables_map> _options;

      std::shared_ptr<chain::database>            _chain_db;
      std::shared_ptr<fc::http::websocket_server> _websocket_server;

      uint32_t         _clock_interval = 1;
      fc::future<void> _clock_task;
};

} } } // namespace loanchain::app::detail
