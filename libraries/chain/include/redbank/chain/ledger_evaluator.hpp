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

   class deposit_evaluator : public evaluator<deposit_evaluator>
   {
      public:
         using operation_type = deposit_operation;

         void_result do_evaluate( const deposit_operation& op );
         void_result do_apply( const deposit_operation& op )const;

         const market_object* _market = nullptr;
   };

   class withdraw_evaluator : public evaluator<withdraw_evaluator>
   {
      public:
         using operation_type = withdraw_operation;

         void_result do_evaluate( const withdraw_operation& op );
         share_type  do_apply( const withdraw_operation& op )const;

         const market_object*     _market = nullptr;
         const collateral_object* _collateral = nullptr;
   };

   class borrow_evaluator : public evaluator<borrow_evaluator>
   {
      public:
         using operation_type = borrow_operation;

         void_result do_evaluate( const borrow_operation& op );
         share_type  do_apply( const borrow_operation& op )const;

         const market_object* _market = nullptr;
   };

   class repay_evaluator : public evaluator<repay_evaluator>
   {
      public:
         using operation_type = repay_operation;

         void_result do_evaluate( const repay_operation& op );
         share_type  do_apply( const repay_operation& op )const;

         const market_object* _market = nullptr;
         const debt_object*   _debt = nullptr;
   };

   class update_uncollateralized_loan_limit_evaluator
      : public evaluator<update_uncollateralized_loan_limit_evaluator>
   {
      public:
         using operation_type = update_uncollateralized_loan_limit_operation;

         void_result do_evaluate( const update_uncollateralized_loan_limit_operation& op );
         void_result do_apply( const update_uncollateralized_loan_limit_operation& op )const;

         const market_object* _market = nullptr;
   };

   class update_user_collateral_asset_status_evaluator
      : public evaluator<update_user_collateral_asset_status_evaluator>
   {
      public:
         using operation_type = update_user_collateral_asset_status_operation;

         void_result do_evaluate( const update_user_collateral_asset_status_operation& op );
         void_result do_apply( const update_user_collateral_asset_status_operation& op )const;

         const collateral_object* _collateral = nullptr;
   };

   class ma_token_transfer_evaluator : public evaluator<ma_token_transfer_evaluator>
   {
      public:
         using operation_type = ma_token_transfer_operation;

         void_result do_evaluate( const ma_token_transfer_operation& op );
         void_result do_apply( const ma_token_transfer_operation& op )const;

         const market_object*     _market = nullptr;
         const collateral_object* _collateral = nullptr;
   };

   class distribute_protocol_income_evaluator : public evaluator<distribute_protocol_income_evaluator>
   {
      public:
         using operation_type = distribute_protocol_income_operation;

         void_result do_evaluate( const distribute_protocol_income_operation& op );
         share_type  do_apply( const distribute_protocol_income_operation& op )const;

         const market_object* _market = nullptr;
   };

} }
