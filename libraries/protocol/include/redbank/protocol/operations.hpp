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
#include <redbank/protocol/base.hpp>
#include <redbank/protocol/account.hpp>
#include <redbank/protocol/market.hpp>
#include <redbank/protocol/ledger.hpp>
#include <redbank/protocol/liquidation.hpp>
#include <redbank/protocol/token.hpp>

namespace redbank { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   using operation = fc::static_variant<
            /*  0 */ account_create_operation,
            /*  1 */ init_asset_operation,
            /*  2 */ update_asset_operation,
            /*  3 */ update_config_operation,
            /*  4 */ set_asset_price_operation,
            /*  5 */ deposit_operation,
            /*  6 */ withdraw_operation,
            /*  7 */ borrow_operation,
            /*  8 */ repay_operation,
            /*  9 */ liquidate_operation,
            /* 10 */ update_uncollateralized_loan_limit_operation,
            /* 11 */ update_user_collateral_asset_status_operation,
            /* 12 */ ma_token_transfer_operation,
            /* 13 */ token_receive_operation,
            /* 14 */ distribute_protocol_income_operation
         >;

   /// @} // operations group

   using operation_result = fc::static_variant< void_result, object_id_type, share_type, liquidation_result >;

   void            operation_validate( const operation& op );
   account_id_type operation_sender( const operation& op );

} } // redbank::protocol

FC_REFLECT_TYPENAME( redbank::protocol::operation )
FC_REFLECT_TYPENAME( redbank::protocol::operation_result )
