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
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,     chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception, chain_exception, 3040000, "operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000, "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_exception,             chain_exception, 3060000, "ledger state exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,      chain_exception, 3070000, "undo database exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( asset_not_initialized,  ledger_exception, 3060001, "asset not initialized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception, ledger_exception, 3060002, "unauthorized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_liquidity, ledger_exception, 3060003, "insufficient liquidity" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,   ledger_exception, 3060004, "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( health_check_failed,    ledger_exception, 3060005, "health check failed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( nested_operation_depth_exceeded, ledger_exception, 3060006,
                                   "nested operation depth exceeded" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( price_not_available,    ledger_exception, 3060007, "price not available" )

   REDBANK_IMPLEMENT_OP_BASE_EXCEPTIONS( init_asset );
   REDBANK_IMPLEMENT_OP_EVALUATE_EXCEPTION( already_initialized, init_asset, 1, "Asset already initialized" )

   REDBANK_IMPLEMENT_OP_BASE_EXCEPTIONS( borrow );
   REDBANK_IMPLEMENT_OP_EVALUATE_EXCEPTION( limit_exceeded, borrow, 1,
                                            "Borrow amount exceeds maximum allowed given current collateral value" )

   REDBANK_IMPLEMENT_OP_BASE_EXCEPTIONS( liquidate );
   REDBANK_IMPLEMENT_OP_EVALUATE_EXCEPTION( health_factor_ok, liquidate, 1,
                                            "User's health factor is not less than 1 and thus cannot be liquidated" )
   REDBANK_IMPLEMENT_OP_EVALUATE_EXCEPTION( positive_uncollateralized_limit, liquidate, 2,
                                            "user has a positive uncollateralized loan limit and thus cannot be liquidated" )
   REDBANK_IMPLEMENT_OP_EVALUATE_EXCEPTION( nothing_to_repay, liquidate, 3,
                                            "Liquidation would not repay any debt" )

} } // redbank::chain
