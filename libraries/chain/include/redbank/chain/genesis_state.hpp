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

#include <redbank/protocol/asset_info.hpp>
#include <redbank/protocol/parameters.hpp>
#include <redbank/chain/types.hpp>

#include <string>
#include <vector>

namespace redbank { namespace chain {
using std::string;
using std::vector;

/**
 * @brief Initial state of a ledger.
 *
 * Accounts are referred to by name so that a genesis file can be written by hand.  Accounts are
 * created in the order listed and receive consecutive ids starting at 1.1.0.
 */
struct genesis_state_type {
   struct initial_account_type {
      string name;
   };
   struct initial_config_type {
      /// Must correspond to one of the initial accounts
      string                       owner_name;
      decimal                      close_factor;
      decimal                      insurance_fund_fee_share;
      decimal                      treasury_fee_share;
      string                       insurance_fund_name;
      string                       treasury_name;
      string                       staking_name;
      decimal                      tax_rate;
      flat_map<string, share_type> tax_caps;
   };
   struct initial_balance_type {
      string     owner_name;
      asset_info asset;
      share_type amount;
   };
   struct initial_price_type {
      asset_info asset;
      decimal    price;
   };
   struct initial_market_type {
      asset_info       asset;
      asset_params     params;
      optional<string> symbol;
   };

   time_point_sec                 initial_timestamp = time_point_sec( REDBANK_DEFAULT_GENESIS_TIMESTAMP );
   initial_config_type            initial_config;
   vector<initial_account_type>   initial_accounts;
   vector<initial_balance_type>   initial_balances;
   vector<initial_price_type>     initial_prices;
   vector<initial_market_type>    initial_markets;

   /// Checks that names are unique and that every referenced account is listed
   void validate()const;
};

} } // namespace redbank::chain

FC_REFLECT(redbank::chain::genesis_state_type::initial_account_type, (name))
FC_REFLECT(redbank::chain::genesis_state_type::initial_config_type,
           (owner_name)(close_factor)(insurance_fund_fee_share)(treasury_fee_share)
           (insurance_fund_name)(treasury_name)(staking_name)(tax_rate)(tax_caps))
FC_REFLECT(redbank::chain::genesis_state_type::initial_balance_type, (owner_name)(asset)(amount))
FC_REFLECT(redbank::chain::genesis_state_type::initial_price_type, (asset)(price))
FC_REFLECT(redbank::chain::genesis_state_type::initial_market_type, (asset)(params)(symbol))
FC_REFLECT(redbank::chain::genesis_state_type,
           (initial_timestamp)(initial_config)(initial_accounts)(initial_balances)(initial_prices)(initial_markets))
