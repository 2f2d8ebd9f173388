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
#include <redbank/protocol/parameters.hpp>

namespace redbank { namespace protocol {

   /**
    * @brief Create the market of an asset
    * @ingroup operations
    *
    * Every market parameter must be present.  The market is assigned the next market index
    * and an ma-token symbol, which defaults to "ma" followed by the asset label.
    */
   struct init_asset_operation : public base_operation
   {
      account_id_type  owner;         ///< Must be the configured owner
      asset_info       asset;         ///< The asset to create a market for
      asset_params     params;        ///< Risk parameters, rate model and initial borrow rate
      optional<string> symbol;        ///< Symbol of the ma-token, optional

      account_id_type sender()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Update the parameters of an existing market
    * @ingroup operations
    *
    * Only the parameters present are changed.  Interest is accrued with the old parameters first.
    */
   struct update_asset_operation : public base_operation
   {
      account_id_type owner;
      asset_info      asset;
      asset_params    params;

      account_id_type sender()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Update the global configuration
    * @ingroup operations
    */
   struct update_config_operation : public base_operation
   {
      account_id_type owner;
      config_params   config;

      account_id_type sender()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Set the price of an asset in the built-in fixed price feed
    * @ingroup operations
    *
    * Prices are quoted in a common reference currency.
    */
   struct set_asset_price_operation : public base_operation
   {
      account_id_type owner;
      asset_info      asset;
      decimal         price;

      account_id_type sender()const { return owner; }
      void            validate()const override;
   };

} } // redbank::protocol

FC_REFLECT( redbank::protocol::init_asset_operation, (owner)(asset)(params)(symbol) )
FC_REFLECT( redbank::protocol::update_asset_operation, (owner)(asset)(params) )
FC_REFLECT( redbank::protocol::update_config_operation, (owner)(config) )
FC_REFLECT( redbank::protocol::set_asset_price_operation, (owner)(asset)(price) )
