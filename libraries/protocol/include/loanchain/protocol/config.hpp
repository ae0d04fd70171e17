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

#define LOANCHAIN_SYMBOL "ETH"

#define LOANCHAIN_MAX_NESTED_OBJECTS (200)

#define LOANCHAIN_MIN_ACCOUNT_NAME_LENGTH 1
#define LOANCHAIN_MAX_ACCOUNT_NAME_LENGTH 63

#define LOANCHAIN_MIN_TOKEN_SYMBOL_LENGTH 1
#define LOANCHAIN_MAX_TOKEN_SYMBOL_LENGTH 16
#define LOANCHAIN_MAX_TOKEN_DECIMALS      18
#define LOANCHAIN_MAX_FEED_NAME_LENGTH    63
#define LOANCHAIN_MAX_PRICE_DECIMALS      18
#define LOANCHAIN_MAX_DOCUMENT_REF_LENGTH 255

/// Every amount on the ledger fits into 128 bits; products are formed in wider integers
#define LOANCHAIN_MAX_AMOUNT_BITS 128

#define LOANCHAIN_100_PERCENT 10000
#define LOANCHAIN_1_PERCENT   (LOANCHAIN_100_PERCENT/100)

/// USD values produced by the valuation engine carry this many decimals
#define LOANCHAIN_USD_DECIMALS 8

/// A loan whose collateral is worth less than this share of its debt may be liquidated, in percent
#define LOANCHAIN_LIQUIDATION_THRESHOLD_PERCENT 120

#define LOANCHAIN_DEFAULT_MAX_QUOTE_AGE              (60*60)        ///< 1 hour
#define LOANCHAIN_DEFAULT_VOTING_PERIOD              (60*60*24*3)   ///< 3 days
#define LOANCHAIN_DEFAULT_INITIAL_COLLATERAL_PERCENT 150
#define LOANCHAIN_DEFAULT_MAX_INTEREST_RATE_BPS      3000           ///< 30%

#define LOANCHAIN_MIN_LOAN_DURATION     (60*60*24)      ///< 1 day
#define LOANCHAIN_MAX_LOAN_DURATION     (60*60*24*365)  ///< 1 year
#define LOANCHAIN_MIN_FUNDING_PERIOD    (60*60)         ///< 1 hour
#define LOANCHAIN_MAX_FUNDING_PERIOD    (60*60*24*30)   ///< 30 days
#define LOANCHAIN_DEFAULT_FUNDING_PERIOD (60*60*24*7)   ///< 7 days
