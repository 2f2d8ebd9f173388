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

#include <fc/exception/exception.hpp>
#include <redbank/protocol/exceptions.hpp>
#include <redbank/protocol/operations.hpp>
#include <redbank/chain/types.hpp>

#define REDBANK_DECLARE_OP_BASE_EXCEPTIONS( op_name )                 \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      redbank::chain::operation_validate_exception,                   \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      redbank::chain::operation_evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
      )

#define REDBANK_IMPLEMENT_OP_BASE_EXCEPTIONS( op_name )               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _validate_exception,                                 \
      redbank::chain::operation_validate_exception,                   \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _evaluate_exception,                                 \
      redbank::chain::operation_evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define REDBANK_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      redbank::chain::op_name ## _evaluate_exception,                 \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum                                                     \
      )

#define REDBANK_IMPLEMENT_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _ ## exc_name,                                       \
      redbank::chain::op_name ## _evaluate_exception,                 \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

namespace redbank { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     redbank::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception, redbank::chain::chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, redbank::chain::chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( ledger_exception,             redbank::chain::chain_exception, 3060000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,      redbank::chain::chain_exception, 3070000 )

   FC_DECLARE_DERIVED_EXCEPTION( asset_not_initialized,  redbank::chain::ledger_exception, 3060001 )
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception, redbank::chain::ledger_exception, 3060002 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_liquidity, redbank::chain::ledger_exception, 3060003 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,   redbank::chain::ledger_exception, 3060004 )
   FC_DECLARE_DERIVED_EXCEPTION( health_check_failed,    redbank::chain::ledger_exception, 3060005 )
   FC_DECLARE_DERIVED_EXCEPTION( nested_operation_depth_exceeded, redbank::chain::ledger_exception, 3060006 )
   FC_DECLARE_DERIVED_EXCEPTION( price_not_available,    redbank::chain::ledger_exception, 3060007 )

   REDBANK_DECLARE_OP_BASE_EXCEPTIONS( init_asset );
   REDBANK_DECLARE_OP_EVALUATE_EXCEPTION( already_initialized, init_asset, 1 )

   REDBANK_DECLARE_OP_BASE_EXCEPTIONS( borrow );
   REDBANK_DECLARE_OP_EVALUATE_EXCEPTION( limit_exceeded, borrow, 1 )

   REDBANK_DECLARE_OP_BASE_EXCEPTIONS( liquidate );
   REDBANK_DECLARE_OP_EVALUATE_EXCEPTION( health_factor_ok, liquidate, 1 )
   REDBANK_DECLARE_OP_EVALUATE_EXCEPTION( positive_uncollateralized_limit, liquidate, 2 )
   REDBANK_DECLARE_OP_EVALUATE_EXCEPTION( nothing_to_repay, liquidate, 3 )

} } // redbank::chain
