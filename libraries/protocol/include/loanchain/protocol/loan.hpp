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
#include <loanchain/protocol/base.hpp>

namespace loanchain { namespace protocol {

   /// Lifecycle of a loan. The numeric values are part of the query surface and never change.
   enum class loan_status : uint8_t
   {
      requested         = 0,
      funded            = 1,
      active            = 2,
      repaid            = 3,
      past_due          = 4,
      expired           = 5,
      voting            = 6,
      liquidated        = 7,
      partially_claimed = 8
   };

   /// No operation may change a loan in a terminal status
   bool is_terminal( loan_status s );

   /// How lenders want a defaulted loan to be resolved
   enum class vote_choice : uint8_t
   {
      liquidate          = 0, ///< sell the collateral to the liquidator against the outstanding debt
      claim_proportional = 1  ///< hand the collateral to the lenders pro rata
   };

   /**
    * @brief Requests a loan and escrows its collateral
    * @ingroup operations
    *
    * The loan stays open for contributions until @ref funding_period_seconds have elapsed.
    * Once fully funded the principal is paid to the borrower and the loan is due after
    * @ref duration_seconds.
    */
   struct loan_request_operation : public base_operation
   {
      account_id_type borrower;
      token_id_type   loan_token;
      token_id_type   collateral_token;
      amount_type     principal;
      amount_type     collateral_amount;
      uint16_t        interest_rate_bps = 0;
      uint32_t        duration_seconds = LOANCHAIN_MIN_LOAN_DURATION;
      amount_type     min_contribution;       ///< Smallest contribution accepted, except one that completes the loan
      uint32_t        funding_period_seconds = LOANCHAIN_DEFAULT_FUNDING_PERIOD;
      uint16_t        risk_score = 0;         ///< Supplied by an external scoring service, stored as is
      string          document_ref;           ///< Content address of the loan paperwork, never interpreted

      account_id_type acting_account()const { return borrower; }
      void            validate()const;
   };

   /**
    * @brief Funds part of a requested loan
    * @ingroup operations
    */
   struct loan_contribute_operation : public base_operation
   {
      account_id_type lender;
      loan_id_type    loan;
      amount_type     amount;

      account_id_type acting_account()const { return lender; }
      void            validate()const;
   };

   /**
    * @brief Returns a lender's contribution to an expired loan
    * @ingroup operations
    *
    * Refunding twice pays nothing the second time.
    */
   struct loan_refund_operation : public base_operation
   {
      account_id_type lender;
      loan_id_type    loan;

      account_id_type acting_account()const { return lender; }
      void            validate()const {}
   };

   /**
    * @brief Repays principal and interest of an active loan
    * @ingroup operations
    *
    * The amount must match the outstanding debt exactly.
    */
   struct loan_repay_operation : public base_operation
   {
      account_id_type borrower;
      loan_id_type    loan;
      amount_type     amount;

      account_id_type acting_account()const { return borrower; }
      void            validate()const;
   };

   /**
    * @brief Casts a lender's vote on how to resolve a defaulted loan
    * @ingroup operations
    */
   struct loan_vote_operation : public base_operation
   {
      account_id_type lender;
      loan_id_type    loan;
      vote_choice     choice = vote_choice::liquidate;

      account_id_type acting_account()const { return lender; }
      void            validate()const {}
   };

   /**
    * @brief Settles a loan by buying its collateral for the outstanding debt
    * @ingroup operations
    *
    * Accepted for an active loan only if the ledger itself finds it liquidatable, and for a
    * defaulted loan only if the lenders voted for liquidation or the vote timed out.
    */
   struct loan_liquidate_operation : public base_operation
   {
      account_id_type liquidator;
      loan_id_type    loan;

      account_id_type acting_account()const { return liquidator; }
      void            validate()const {}
   };

} } // loanchain::protocol

FC_REFLECT_ENUM( loanchain::protocol::loan_status,
                 (requested)(funded)(active)(repaid)(past_due)(expired)(voting)(liquidated)(partially_claimed) )
FC_REFLECT_ENUM( loanchain::protocol::vote_choice, (liquidate)(claim_proportional) )

FC_REFLECT( loanchain::protocol::loan_request_operation,
            (borrower)(loan_token)(collateral_token)(principal)(collateral_amount)(interest_rate_bps)
            (duration_seconds)(min_contribution)(funding_period_seconds)(risk_score)(document_ref) )
FC_REFLECT( loanchain::protocol::loan_contribute_operation, (lender)(loan)(amount) )
FC_REFLECT( loanchain::protocol::loan_refund_operation, (lender)(loan) )
FC_REFLECT( loanchain::protocol::loan_repay_operation, (borrower)(loan)(amount) )
FC_REFLECT( loanchain::protocol::loan_vote_operation, (lender)(loan)(choice) )
FC_REFLECT( loanchain::protocol::loan_liquidate_operation, (liquidator)(loan) )
