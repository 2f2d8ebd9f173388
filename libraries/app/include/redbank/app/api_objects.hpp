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

#include <redbank/chain/market_object.hpp>
#include <redbank/chain/position_object.hpp>

#include <fc/optional.hpp>

namespace redbank { namespace app {
   using namespace redbank::chain;

   /// Market state as seen at a point in time; the totals are converted with the projected indices
   struct market_api_object
   {
      market_api_object() {}
      market_api_object( const market_object& m, time_point_sec now );

      market_id_type     id;
      asset_info         asset;
      uint32_t           index = 0;
      string             ma_token_symbol;

      decimal            borrow_index;
      decimal            liquidity_index;
      decimal            borrow_rate;
      decimal            liquidity_rate;
      market_parameters  params;
      time_point_sec     interests_last_updated;

      scaled_amount_type collateral_total_scaled = 0;
      scaled_amount_type debt_total_scaled = 0;
      share_type         collateral_total;
      share_type         debt_total;
      share_type         available_liquidity;
      share_type         protocol_income_to_distribute;
      share_type         bad_debt;
   };

   struct user_collateral_api_object
   {
      asset_info         asset;
      string             ma_token_symbol;
      scaled_amount_type amount_scaled = 0;
      share_type         amount;
      bool               enabled = false;
   };

   struct user_debt_api_object
   {
      asset_info         asset;
      scaled_amount_type amount_scaled = 0;
      share_type         amount;
      bool               uncollateralized = false;
   };

   struct uncollateralized_limit_api_object
   {
      asset_info asset;
      share_type limit;
   };

} } // redbank::app

FC_REFLECT( redbank::app::market_api_object,
            (id)(asset)(index)(ma_token_symbol)
            (borrow_index)(liquidity_index)(borrow_rate)(liquidity_rate)(params)(interests_last_updated)
            (collateral_total_scaled)(debt_total_scaled)(collateral_total)(debt_total)
            (available_liquidity)(protocol_income_to_distribute)(bad_debt) )
FC_REFLECT( redbank::app::user_collateral_api_object, (asset)(ma_token_symbol)(amount_scaled)(amount)(enabled) )
FC_REFLECT( redbank::app::user_debt_api_object, (asset)(amount_scaled)(amount)(uncollateralized) )
FC_REFLECT( redbank::app::uncollateralized_limit_api_object, (asset)(limit) )
