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
#include <loanchain/protocol/operations.hpp>

namespace loanchain { namespace protocol {

struct operation_validator
{
   using result_type = void;
   template<typename T>
   void operator()( const T& v )const { v.validate(); }
};

struct operation_get_acting_accounts_visitor
{
   flat_set<account_id_type>& result;

   using result_type = void;
   template<typename T>
   void operator()( const T& v )const { result.insert( v.acting_account() ); }
};

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

void operation_get_acting_accounts( const operation& op, flat_set<account_id_type>& result )
{
   operation_get_acting_accounts_visitor vtor = { result };
   op.visit( vtor );
}

} } // loanchain::protocol
