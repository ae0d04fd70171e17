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
#include <loanchain/chain/evaluator.hpp>

#include <loanchain/protocol/token.hpp>

namespace loanchain { namespace chain {

   class token_object;
   class price_feed_object;

   class token_register_evaluator : public evaluator<token_register_evaluator>
   {
      public:
         using operation_type = token_register_operation;

         void_result do_evaluate( const token_register_operation& op ) const;
         object_id_type do_apply( const token_register_operation& op ) const;
   };

   class token_deactivate_evaluator : public evaluator<token_deactivate_evaluator>
   {
      public:
         using operation_type = token_deactivate_operation;

         void_result do_evaluate( const token_deactivate_operation& op );
         void_result do_apply( const token_deactivate_operation& op ) const;

         const token_object* _token = nullptr;
   };

   class price_feed_publish_evaluator : public evaluator<price_feed_publish_evaluator>
   {
      public:
         using operation_type = price_feed_publish_operation;

         void_result do_evaluate( const price_feed_publish_operation& op );
         object_id_type do_apply( const price_feed_publish_operation& op ) const;

         const price_feed_object* _feed = nullptr;
   };

} } // loanchain::chain
