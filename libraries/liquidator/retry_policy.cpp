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
#include <loanchain/liquidator/retry_policy.hpp>

#include <fc/thread/thread.hpp>

#include <algorithm>

namespace loanchain { namespace liquidator {

void default_sleep( fc::microseconds delay )
{
   if( delay.count() > 0 )
      fc::usleep( delay );
}

retry_policy::retry_policy( uint32_t max_attempts, std::vector<fc::microseconds> delays )
   :_max_attempts( max_attempts ), _delays( std::move( delays ) )
{
   FC_ASSERT( _max_attempts > 0, "A retry policy needs at least one attempt" );
   for( const auto& d : _delays )
      FC_ASSERT( d.count() >= 0, "Retry delays must not be negative" );
}

retry_policy retry_policy::fixed( uint32_t max_attempts, fc::microseconds delay )
{
   return retry_policy( max_attempts, std::vector<fc::microseconds>{ delay } );
}

fc::microseconds retry_policy::delay_after( uint32_t failed_attempts )const
{
   if( _delays.empty() || failed_attempts == 0 )
      return fc::microseconds( 0 );
   const size_t index = std::min<size_t>( failed_attempts - 1, _delays.size() - 1 );
   return _delays[index];
}

} } // loanchain::liquidator
