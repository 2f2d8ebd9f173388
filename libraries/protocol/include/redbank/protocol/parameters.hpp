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
#include <redbank/protocol/interest_rate_model.hpp>

namespace redbank { namespace protocol {

   /// Risk parameters and rate model of one market
   struct market_parameters
   {
      decimal                          max_loan_to_value;
      decimal                          reserve_factor;
      decimal                          maintenance_margin;
      decimal                          liquidation_bonus;
      protocol::interest_rate_strategy interest_rate_strategy;

      void validate()const;
   };

   /**
    *  @brief Market parameters as carried by init and update operations.
    *
    *  Every field is required when a market is initialized.  On update only the fields
    *  present are applied, and the merged result is validated again.
    */
   struct asset_params
   {
      optional<decimal>                          initial_borrow_rate;
      optional<decimal>                          max_loan_to_value;
      optional<decimal>                          reserve_factor;
      optional<decimal>                          maintenance_margin;
      optional<decimal>                          liquidation_bonus;
      optional<protocol::interest_rate_strategy> interest_rate_strategy;

      bool              is_complete()const;
      market_parameters to_market_parameters()const;
      void              apply_to( market_parameters& params )const;
      /// checks each present field on its own
      void              validate()const;
   };

   /**
    *  @brief Global protocol configuration of the red bank.
    *
    *  The fee shares split the protocol income of every market; whatever is left after
    *  the insurance fund and the treasury goes to the staking account.  tax_rate and
    *  tax_caps describe the chain level tax taken on native transfers.
    */
   struct redbank_config
   {
      account_id_type              owner;
      decimal                      close_factor;
      decimal                      insurance_fund_fee_share;
      decimal                      treasury_fee_share;
      account_id_type              insurance_fund;
      account_id_type              treasury;
      account_id_type              staking;
      decimal                      tax_rate;
      flat_map<string, share_type> tax_caps;

      void validate()const;
   };

   /// Partial update of redbank_config
   struct config_params
   {
      optional<account_id_type>              owner;
      optional<decimal>                      close_factor;
      optional<decimal>                      insurance_fund_fee_share;
      optional<decimal>                      treasury_fee_share;
      optional<account_id_type>              insurance_fund;
      optional<account_id_type>              treasury;
      optional<account_id_type>              staking;
      optional<decimal>                      tax_rate;
      optional<flat_map<string, share_type>> tax_caps;

      void apply_to( redbank_config& config )const;
      void validate()const;
   };

} } // redbank::protocol

FC_REFLECT( redbank::protocol::market_parameters,
            (max_loan_to_value)(reserve_factor)(maintenance_margin)(liquidation_bonus)(interest_rate_strategy) )
FC_REFLECT( redbank::protocol::asset_params,
            (initial_borrow_rate)(max_loan_to_value)(reserve_factor)(maintenance_margin)(liquidation_bonus)
            (interest_rate_strategy) )
FC_REFLECT( redbank::protocol::redbank_config,
            (owner)(close_factor)(insurance_fund_fee_share)(treasury_fee_share)
            (insurance_fund)(treasury)(staking)(tax_rate)(tax_caps) )
FC_REFLECT( redbank::protocol::config_params,
            (owner)(close_factor)(insurance_fund_fee_share)(treasury_fee_share)
            (insurance_fund)(treasury)(staking)(tax_rate)(tax_caps) )
