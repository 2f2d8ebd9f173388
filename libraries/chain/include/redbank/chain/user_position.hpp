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
#include <redbank/protocol/asset_info.hpp>
#include <redbank/chain/types.hpp>

namespace redbank { namespace chain {

   enum health_status_type
   {
      not_borrowing,
      borrowing
   };

   /**
    * @brief Health of a position
    *
    * health_factor is only meaningful while borrowing: a user without collateralized debt
    * has no health factor at all.
    */
   struct health_status
   {
      health_status_type status = not_borrowing;
      decimal            health_factor;

      bool is_borrowing()const { return status == borrowing; }
   };

   /// One asset of a user position; amounts are in underlying units, values in the reference currency
   struct user_asset_position
   {
      asset_info     asset;
      market_id_type market;
      decimal        price;

      share_type     collateral_amount;
      fc::uint128_t  collateral_value = 0;
      bool           collateral_enabled = false;

      share_type     debt_amount;
      fc::uint128_t  debt_value = 0;
      bool           uncollateralized = false;

      decimal        max_loan_to_value;
      decimal        maintenance_margin;
      decimal        liquidation_bonus;
   };

   /**
    * @brief Aggregate state of a user across all markets
    *
    * Collateral sums only cover positions enabled as collateral.  Debt taken against an
    * uncollateralized loan limit counts in total_debt_value but not in
    * total_collateralized_debt_value, which is what the health factor is computed from.
    */
   struct user_position
   {
      fc::uint128_t total_collateral_value = 0;
      fc::uint128_t total_debt_value = 0;
      fc::uint128_t total_collateralized_debt_value = 0;
      fc::uint128_t max_debt_value = 0;                     ///< Sum of collateral value times max LTV
      fc::uint128_t weighted_maintenance_margin_value = 0;  ///< Sum of collateral value times maintenance margin
      health_status health;

      vector<user_asset_position> assets;

      const user_asset_position* find_asset( const asset_info& a )const;
   };

} } // redbank::chain

FC_REFLECT_ENUM( redbank::chain::health_status_type, (not_borrowing)(borrowing) )
FC_REFLECT( redbank::chain::health_status, (status)(health_factor) )
FC_REFLECT( redbank::chain::user_asset_position,
            (asset)(market)(price)
            (collateral_amount)(collateral_value)(collateral_enabled)
            (debt_amount)(debt_value)(uncollateralized)
            (max_loan_to_value)(maintenance_margin)(liquidation_bonus) )
FC_REFLECT( redbank::chain::user_position,
            (total_collateral_value)(total_debt_value)(total_collateralized_debt_value)
            (max_debt_value)(weighted_maintenance_margin_value)(health)(assets) )
