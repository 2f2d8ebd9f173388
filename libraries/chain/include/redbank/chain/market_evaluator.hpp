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

   class init_asset_evaluator : public evaluator<init_asset_evaluator>
   {
      public:
         using operation_type = init_asset_operation;

         void_result    do_evaluate( const init_asset_operation& op );
         object_id_type do_apply( const init_asset_operation& op )const;

         string            _symbol;
         market_parameters _params;
   };

   class update_asset_evaluator : public evaluator<update_asset_evaluator>
   {
      public:
         using operation_type = update_asset_operation;

         void_result do_evaluate( const update_asset_operation& op );
         void_result do_apply( const update_asset_operation& op )const;

         const market_object* _market = nullptr;
         market_parameters    _params;
   };

   class update_config_evaluator : public evaluator<update_config_evaluator>
   {
      public:
         using operation_type = update_config_operation;

         void_result do_evaluate( const update_config_operation& op );
         void_result do_apply( const update_config_operation& op )const;

         redbank_config _config;
   };

   class set_asset_price_evaluator : public evaluator<set_asset_price_evaluator>
   {
      public:
         using operation_type = set_asset_price_operation;

         void_result do_evaluate( const set_asset_price_operation& op )const;
         void_result do_apply( const set_asset_price_operation& op )const;
   };

} }
