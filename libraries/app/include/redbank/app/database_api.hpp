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
#include <redbank/app/api_objects.hpp>
#include <redbank/chain/database.hpp>

#include <fc/variant_object.hpp>

#include <memory>
#include <vector>

namespace redbank { namespace app {

using namespace redbank::chain;
using std::string;
using std::vector;

class database_api_impl;

/**
 * @brief The database_api class implements the read-only queries of the red bank
 *
 * Accounts are given either by name or by object id.  Amounts are reported as they would be after
 * accruing interest up to the head time of the ledger, without modifying the ledger.
 */
class database_api
{
   public:
      explicit database_api( const redbank::chain::database& db );
      ~database_api();

      /////////////
      // Objects //
      /////////////

      /**
       * @brief Get the objects corresponding to the provided IDs
       * @param ids IDs of the objects to retrieve
       * @return The objects retrieved, in the order they are mentioned in ids
       *
       * If any of the provided IDs does not map to an object, a null variant is returned in its position.
       */
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      ////////////
      // Config //
      ////////////

      /// @brief Retrieve the current global configuration of the red bank
      redbank_config get_config()const;

      /// @brief Retrieve the ledger clock
      time_point_sec get_head_time()const;

      /////////////
      // Markets //
      /////////////

      /**
       * @brief Get the market of an asset
       * @param asset The asset of the market
       * @return The market, throws asset_not_initialized if there is none
       */
      market_api_object get_market( const asset_info& asset )const;

      /**
       * @brief List the markets in the order they were initialized
       * @param start_after Index of the last market of the previous page, or absent for the first page
       * @param limit Maximum number of markets to fetch, must not exceed the configured limit
       */
      vector<market_api_object> list_markets( const optional<uint32_t>& start_after, uint32_t limit )const;

      /// @brief Convert an underlying amount to ma-token shares at the current liquidity index
      scaled_amount_type get_scaled_liquidity_amount( const asset_info& asset, const share_type& amount )const;
      /// @brief Convert ma-token shares to the underlying amount at the current liquidity index
      share_type get_underlying_liquidity_amount( const asset_info& asset, const scaled_amount_type& amount_scaled )const;
      /// @brief Convert a debt amount to debt shares at the current borrow index
      scaled_amount_type get_scaled_debt_amount( const asset_info& asset, const share_type& amount )const;
      /// @brief Convert debt shares to the debt amount at the current borrow index
      share_type get_underlying_debt_amount( const asset_info& asset, const scaled_amount_type& amount_scaled )const;

      ///////////
      // Users //
      ///////////

      /// @brief Collateral positions of a user, one per market with a non-zero balance
      vector<user_collateral_api_object> get_user_collaterals( const string& account_name_or_id )const;

      /// @brief Debt positions of a user, one per market with outstanding debt
      vector<user_debt_api_object> get_user_debts( const string& account_name_or_id )const;

      /// @brief The uncollateralized loan limit of a user in one market, zero if none was granted
      share_type get_uncollateralized_loan_limit( const string& account_name_or_id, const asset_info& asset )const;

      /// @brief Every uncollateralized loan limit granted to a user
      vector<uncollateralized_limit_api_object> get_uncollateralized_loan_limits( const string& account_name_or_id )const;

      /**
       * @brief Valuation of a user over all markets
       *
       * Includes the collateral and debt values in the reference currency, the borrowing power and
       * the health status.
       */
      user_position get_user_position( const string& account_name_or_id )const;

      /// @brief Balance an account holds outside of the red bank
      share_type get_account_balance( const string& account_name_or_id, const asset_info& asset )const;

   private:
      std::shared_ptr< database_api_impl > my;
};

} }
