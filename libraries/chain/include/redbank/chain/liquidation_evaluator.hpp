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
#include <redbank/chain/evaluator.hpp>

namespace redbank { namespace chain {

   class market_object;
   class collateral_object;
   class debt_object;

   /**
    *  Repays part of the debt of a borrower whose health factor fell below one and hands the
    *  liquidator the matching collateral plus the liquidation bonus.
    *
    *  Interest is accrued on every market of the borrower before the health factor is read, and
    *  the amounts are computed before any position is touched.
    */
   class liquidate_evaluator : public evaluator<liquidate_evaluator>
   {
      public:
         using operation_type = liquidate_operation;

         void_result        do_evaluate( const liquidate_operation& op );
         liquidation_result do_apply( const liquidate_operation& op )const;

         const market_object* _collateral_market = nullptr;
         const market_object* _debt_market = nullptr;
   };

   /// floor( repay * ( 1 + bonus ) * debt_price / collateral_price )
   share_type calculate_liquidated_collateral( const share_type& debt_repaid, const decimal& liquidation_bonus,
                                               const decimal& debt_price, const decimal& collateral_price );

   /// Largest repayment whose seized collateral fits in @p collateral_balance
   share_type calculate_max_debt_repayable( const share_type& collateral_balance, const decimal& liquidation_bonus,
                                            const decimal& debt_price, const decimal& collateral_price );

} }
