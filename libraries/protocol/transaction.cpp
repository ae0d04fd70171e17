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
#include <loanchain/protocol/exceptions.hpp>
#include <loanchain/protocol/transaction.hpp>

namespace loanchain { namespace protocol {

void transaction::validate()const
{
   LOANCHAIN_ASSERT( !operations.empty(), tx_missing_operations, "A transaction must have at least one operation" );
   for( const auto& op : operations )
      operation_validate( op );
   for( const auto& acting : get_acting_accounts() )
      LOANCHAIN_ASSERT( acting == signer, tx_signer_mismatch,
                        "Operation acts on behalf of ${a} but the transaction is signed by ${s}",
                        ("a",acting)("s",signer) );
}

flat_set<account_id_type> transaction::get_acting_accounts()const
{
   flat_set<account_id_type> result;
   for( const auto& op : operations )
      operation_get_acting_accounts( op, result );
   return result;
}

} } // loanchain::protocol
