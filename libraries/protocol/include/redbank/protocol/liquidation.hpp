/*
 * Copyright (c) 2024 RedBank Developers, and contributors.
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

namespace redbank { namespace protocol {

   /**
    * @brief Repay part of an unhealthy borrower's debt in exchange for discounted collateral
    * @ingroup operations
    *
    * The repayment is capped by the close factor of the outstanding debt and by the collateral
    * the borrower holds; the rest of the amount sent is refunded.  The seized collateral is paid
    * either as ma-token shares or as the underlying asset.
    */
   struct liquidate_operation : public base_operation
   {
      account_id_type liquidator;
      asset_info      collateral_asset;
      asset_info      debt_asset;
      account_id_type user;                     ///< The borrower to liquidate
      share_type      amount;                   ///< Amount of the debt asset sent to repay
      bool            receive_ma_token = false;

      account_id_type sender()const { return liquidator; }
      void            validate()const override;
   };

   /// Observable outcome of a liquidation, in underlying units
   struct liquidation_result
   {
      share_type debt_amount_repaid;
      share_type refund_amount;
      share_type collateral_amount_liquidated;
      share_type collateral_amount_received;   ///< What reached the liquidator after tax
      share_type bad_debt_written_off;
   };

} } // redbank::protocol

FC_REFLECT( redbank::protocol::liquidate_operation,
            (liquidator)(collateral_asset)(debt_asset)(user)(amount)(receive_ma_token) )
FC_REFLECT( redbank::protocol::liquidation_result,
            (debt_amount_repaid)(refund_amount)(collateral_amount_liquidated)(collateral_amount_received)
            (bad_debt_written_off) )
