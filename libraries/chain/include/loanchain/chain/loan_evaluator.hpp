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

#include <loanchain/protocol/loan.hpp>

namespace loanchain { namespace chain {

   class loan_object;
   class loan_contribution_object;
   class token_object;

   class loan_request_evaluator : public evaluator<loan_request_evaluator>
   {
      public:
         using operation_type = loan_request_operation;

         void_result do_evaluate( const loan_request_operation& op );
         object_id_type do_apply( const loan_request_operation& op ) const;

         const token_object* _collateral_token = nullptr;
   };

   class loan_contribute_evaluator : public evaluator<loan_contribute_evaluator>
   {
      public:
         using operation_type = loan_contribute_operation;

         void_result do_evaluate( const loan_contribute_operation& op );
         object_id_type do_apply( const loan_contribute_operation& op ) const;

         const loan_object*  _loan = nullptr;
         const token_object* _loan_token = nullptr;
   };

   class loan_refund_evaluator : public evaluator<loan_refund_evaluator>
   {
      public:
         using operation_type = loan_refund_operation;

         void_result do_evaluate( const loan_refund_operation& op );
         void_result do_apply( const loan_refund_operation& op ) const;

         const loan_object*              _loan = nullptr;
         const loan_contribution_object* _contribution = nullptr;
   };

   class loan_repay_evaluator : public evaluator<loan_repay_evaluator>
   {
      public:
         using operation_type = loan_repay_operation;

         void_result do_evaluate( const loan_repay_operation& op );
         void_result do_apply( const loan_repay_operation& op ) const;

         const loan_object* _loan = nullptr;
   };

   class loan_vote_evaluator : public evaluator<loan_vote_evaluator>
   {
      public:
         using operation_type = loan_vote_operation;

         void_result do_evaluate( const loan_vote_operation& op );
         void_result do_apply( const loan_vote_operation& op ) const;

         const loan_object*              _loan = nullptr;
         const loan_contribution_object* _contribution = nullptr;
   };

   class loan_liquidate_evaluator : public evaluator<loan_liquidate_evaluator>
   {
      public:
         using operation_type = loan_liquidate_operation;

         void_result do_evaluate( const loan_liquidate_operation& op );
         void_result do_apply( const loan_liquidate_operation& op ) const;

         const loan_object* _loan = nullptr;
   };

} } // loanchain::chain
