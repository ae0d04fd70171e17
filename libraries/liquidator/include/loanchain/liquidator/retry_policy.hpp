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

#include <loanchain/liquidator/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/time.hpp>

#include <functional>
#include <string>
#include <vector>

namespace loanchain { namespace liquidator {

   using sleep_function = std::function<void( fc::microseconds )>;

   /// Suspends the current fc task, the default way to wait between attempts
   void default_sleep( fc::microseconds delay );

   /**
    *  @brief how often and how patiently ledger reads are repeated
    *
    *  Only @ref ledger_unavailable_exception is retried, every other error is passed on at once.
    *  The delay before attempt n (n > 1) is delays[n-2], the last delay repeats if there are
    *  fewer delays than attempts.
    */
   class retry_policy
   {
      public:
         retry_policy( uint32_t max_attempts, std::vector<fc::microseconds> delays );

         static retry_policy fixed( uint32_t max_attempts, fc::microseconds delay );

         uint32_t max_attempts()const { return _max_attempts; }
         const std::vector<fc::microseconds>& delays()const { return _delays; }

         /// @return how long to wait after @p failed_attempts attempts failed
         fc::microseconds delay_after( uint32_t failed_attempts )const;

         template<typename Call>
         auto run( const std::string& what, const sleep_function& sleep, Call&& call )const -> decltype( call() )
         {
            for( uint32_t attempt = 1; ; ++attempt )
            {
               try
               {
                  return call();
               }
               catch( const ledger_unavailable_exception& e )
               {
                  if( attempt >= _max_attempts )
                     throw;
                  dlog( "${what} failed on attempt ${n} of ${m}: ${e}",
                        ("what",what)("n",attempt)("m",_max_attempts)("e",e.to_string()) );
                  sleep( delay_after( attempt ) );
               }
            }
         }

      private:
         uint32_t                      _max_attempts;
         std::vector<fc::microseconds> _delays;
   };

} } // loanchain::liquidator
