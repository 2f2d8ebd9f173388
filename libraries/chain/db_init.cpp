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
#include <redbank/chain/database.hpp>

#include <redbank/chain/account_object.hpp>
#include <redbank/chain/global_property_object.hpp>
#include <redbank/chain/market_object.hpp>
#include <redbank/chain/position_object.hpp>
#include <redbank/chain/price_feed_object.hpp>

#include <redbank/chain/account_evaluator.hpp>
#include <redbank/chain/market_evaluator.hpp>
#include <redbank/chain/ledger_evaluator.hpp>
#include <redbank/chain/liquidation_evaluator.hpp>
#include <redbank/chain/token_evaluator.hpp>

#include <redbank/db/index.hpp>

namespace redbank { namespace chain {

using redbank::db::primary_index;

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<account_create_evaluator>();
   register_evaluator<init_asset_evaluator>();
   register_evaluator<update_asset_evaluator>();
   register_evaluator<update_config_evaluator>();
   register_evaluator<set_asset_price_evaluator>();
   register_evaluator<deposit_evaluator>();
   register_evaluator<withdraw_evaluator>();
   register_evaluator<borrow_evaluator>();
   register_evaluator<repay_evaluator>();
   register_evaluator<liquidate_evaluator>();
   register_evaluator<update_uncollateralized_loan_limit_evaluator>();
   register_evaluator<update_user_collateral_asset_status_evaluator>();
   register_evaluator<ma_token_transfer_evaluator>();
   register_evaluator<token_receive_evaluator>();
   register_evaluator<distribute_protocol_income_evaluator>();
}

void database::initialize_indexes()
{
   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<market_index> >();
   add_index< primary_index<debt_index> >();
   add_index< primary_index<collateral_index> >();
   add_index< primary_index<uncollateralized_limit_index> >();
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<price_feed_index> >();

   //Implementation object indexes
   add_index< primary_index<global_property_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
}

} }
