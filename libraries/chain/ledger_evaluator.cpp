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
#include <redbank/chain/ledger_evaluator.hpp>
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

void_result deposit_evaluator::do_evaluate( const deposit_operation& op )
{ try {
   const database& d = db();
   _market = &d.get_market( op.asset );
   verify_account_exists( op.beneficiary() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result deposit_evaluator::do_apply( const deposit_operation& op )const
{ try {
   database& d = db();

   d.accrue_interests( *_market );
   collect_funds( op.depositor, op.asset, op.amount );

   const scaled_amount_type amount_scaled = get_scaled_liquidity_amount( op.amount, _market->liquidity_index );
   REDBANK_ASSERT( amount_scaled > 0, invalid_parameter,
                   "Deposit amount ${a} is too small to mint any ma-token", ("a", op.amount) );

   d.modify( *_market, [&op]( market_object& m ) {
      m.available_liquidity += op.amount;
   });

   const collateral_object& collateral = d.increase_collateral( op.beneficiary(), *_market, amount_scaled );
   if( !collateral.enabled )
      d.modify( collateral, []( collateral_object& c ) { c.enabled = true; } );

   d.update_interest_rates( *_market );

   ilog( "${u} deposited ${a} ${s} for ${b}",
         ("u", op.depositor)("a", op.amount)("s", asset_label( op.asset ))("b", op.beneficiary()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result withdraw_evaluator::do_evaluate( const withdraw_operation& op )
{ try {
   const database& d = db();
   _market = &d.get_market( op.asset );
   _collateral = d.find_collateral( op.account, _market->get_id() );
   REDBANK_ASSERT( _collateral != nullptr, insufficient_balance,
                   "User has no balance (asset: ${a})", ("a", asset_label( op.asset )) );
   if( op.recipient.valid() )
      verify_account_exists( *op.recipient );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type withdraw_evaluator::do_apply( const withdraw_operation& op )const
{ try {
   database& d = db();

   d.accrue_user_markets( op.account );

   const share_type balance = get_underlying_liquidity_amount( _collateral->amount_scaled, _market->liquidity_index );
   const share_type amount = op.amount.valid() ? *op.amount : balance;
   REDBANK_ASSERT( amount > 0 && amount <= balance, insufficient_balance,
                   "Withdraw amount must be greater than 0 and less or equal user balance "
                   "(asset: ${a}, amount: ${m}, balance: ${b})",
                   ("a", asset_label( op.asset ))("m", amount)("b", balance) );
   REDBANK_ASSERT( _market->available_liquidity >= amount, insufficient_liquidity,
                   "Not enough liquidity in the ${a} market to withdraw ${m}, available ${l}",
                   ("a", asset_label( op.asset ))("m", amount)("l", _market->available_liquidity) );

   scaled_amount_type amount_scaled = _collateral->amount_scaled;
   if( amount < balance )
      amount_scaled = std::min( amount_scaled, get_scaled_liquidity_amount_ceil( amount, _market->liquidity_index ) );

   const bool was_enabled = _collateral->enabled;
   d.decrease_collateral( *_collateral, amount_scaled );
   d.modify( *_market, [&amount]( market_object& m ) {
      m.available_liquidity -= amount;
   });

   if( was_enabled )
      d.assert_healthy( op.account, "Withdraw" );

   d.update_interest_rates( *_market );

   const account_id_type recipient = op.recipient.valid() ? *op.recipient : op.account;
   const share_type received = d.pay_out( recipient, op.asset, amount );

   ilog( "${u} withdrew ${a} ${s} to ${r} (received ${n})",
         ("u", op.account)("a", amount)("s", asset_label( op.asset ))("r", recipient)("n", received) );
   return amount;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result borrow_evaluator::do_evaluate( const borrow_operation& op )
{ try {
   _market = &db().get_market( op.asset );
   if( op.recipient.valid() )
      verify_account_exists( *op.recipient );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type borrow_evaluator::do_apply( const borrow_operation& op )const
{ try {
   database& d = db();

   // the health check spans every market of the borrower
   d.accrue_interests( *_market );
   d.accrue_user_markets( op.borrower );

   const share_type limit = d.get_uncollateralized_limit( op.borrower, _market->get_id() );
   const bool uncollateralized = limit > 0;
   if( uncollateralized )
   {
      const debt_object* existing = d.find_debt( op.borrower, _market->get_id() );
      const share_type existing_debt = existing == nullptr ? share_type(0)
                                     : get_underlying_debt_amount( existing->amount_scaled, _market->borrow_index );
      REDBANK_ASSERT( existing_debt + op.amount <= limit, borrow_limit_exceeded,
                      "borrow amount exceeds uncollateralized loan limit given existing debt "
                      "(limit: ${l}, debt: ${d}, amount: ${a})",
                      ("l", limit)("d", existing_debt)("a", op.amount) );
   }

   REDBANK_ASSERT( _market->available_liquidity >= op.amount, insufficient_liquidity,
                   "Not enough liquidity in the ${a} market to borrow ${m}, available ${l}",
                   ("a", asset_label( op.asset ))("m", op.amount)("l", _market->available_liquidity) );

   const scaled_amount_type amount_scaled = get_scaled_debt_amount( op.amount, _market->borrow_index );
   d.increase_debt( op.borrower, *_market, amount_scaled, uncollateralized );
   d.modify( *_market, [&op]( market_object& m ) {
      m.available_liquidity -= op.amount;
   });

   if( !uncollateralized )
   {
      const user_position position = d.get_user_position( op.borrower );
      REDBANK_ASSERT( position.total_collateralized_debt_value <= position.max_debt_value, borrow_limit_exceeded,
                      "Borrow amount exceeds maximum allowed given current collateral value "
                      "(debt value: ${d}, max debt value: ${m})",
                      ("d", position.total_collateralized_debt_value)("m", position.max_debt_value) );
   }

   d.update_interest_rates( *_market );

   const account_id_type recipient = op.recipient.valid() ? *op.recipient : op.borrower;
   const share_type received = d.pay_out( recipient, op.asset, op.amount );

   ilog( "${u} borrowed ${a} ${s} (received ${n})",
         ("u", op.borrower)("a", op.amount)("s", asset_label( op.asset ))("n", received) );
   return op.amount;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result repay_evaluator::do_evaluate( const repay_operation& op )
{ try {
   const database& d = db();
   _market = &d.get_market( op.asset );
   _debt = d.find_debt( op.beneficiary(), _market->get_id() );
   FC_ASSERT( _debt != nullptr, "Cannot repay 0 debt (asset: ${a})", ("a", asset_label( op.asset )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type repay_evaluator::do_apply( const repay_operation& op )const
{ try {
   database& d = db();

   d.accrue_interests( *_market );
   collect_funds( op.account, op.asset, op.amount );

   const share_type debt_amount = get_underlying_debt_amount( _debt->amount_scaled, _market->borrow_index );

   share_type repaid = op.amount;
   share_type refund = 0;
   scaled_amount_type amount_scaled;
   if( op.amount >= debt_amount )
   {
      amount_scaled = _debt->amount_scaled;
      repaid = debt_amount;
      refund = op.amount - debt_amount;
   }
   else
      amount_scaled = get_scaled_debt_amount_floor( op.amount, _market->borrow_index );

   d.decrease_debt( *_debt, amount_scaled );
   d.modify( *_market, [&repaid]( market_object& m ) {
      m.available_liquidity += repaid;
   });

   d.update_interest_rates( *_market );

   if( refund > 0 )
      d.pay_out( op.account, op.asset, refund );

   ilog( "${u} repaid ${a} ${s} for ${b}, refunded ${r}",
         ("u", op.account)("a", repaid)("s", asset_label( op.asset ))("b", op.beneficiary())("r", refund) );
   return refund;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_uncollateralized_loan_limit_evaluator::do_evaluate(
      const update_uncollateralized_loan_limit_operation& op )
{ try {
   verify_owner( op.owner );
   _market = &db().get_market( op.asset );
   verify_account_exists( op.user );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_uncollateralized_loan_limit_evaluator::do_apply(
      const update_uncollateralized_loan_limit_operation& op )const
{ try {
   database& d = db();
   const market_id_type market_id = _market->get_id();

   const auto& idx = d.get_index_type<uncollateralized_limit_index>().indices().get<by_account_market>();
   auto itr = idx.find( boost::make_tuple( op.user, market_id ) );
   if( op.new_limit == 0 )
   {
      if( itr != idx.end() )
         d.remove( *itr );
   }
   else if( itr == idx.end() )
   {
      d.create<uncollateralized_limit_object>( [&op,&market_id]( uncollateralized_limit_object& l ) {
         l.user = op.user;
         l.market = market_id;
         l.limit = op.new_limit;
      });
   }
   else
   {
      d.modify( *itr, [&op]( uncollateralized_limit_object& l ) {
         l.limit = op.new_limit;
      });
   }

   const debt_object* debt = d.find_debt( op.user, market_id );
   if( debt != nullptr )
   {
      const bool uncollateralized = op.new_limit > 0;
      d.modify( *debt, [uncollateralized]( debt_object& o ) {
         o.uncollateralized = uncollateralized;
      });
   }

   ilog( "Uncollateralized loan limit of ${u} on ${a} set to ${l}",
         ("u", op.user)("a", asset_label( op.asset ))("l", op.new_limit) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_user_collateral_asset_status_evaluator::do_evaluate(
      const update_user_collateral_asset_status_operation& op )
{ try {
   const database& d = db();
   const market_object& market = d.get_market( op.asset );
   _collateral = d.find_collateral( op.account, market.get_id() );
   if( op.enable )
      REDBANK_ASSERT( _collateral != nullptr, insufficient_balance,
                      "User address ${u} has no balance in specified asset ${a}",
                      ("u", op.account)("a", asset_label( op.asset )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_user_collateral_asset_status_evaluator::do_apply(
      const update_user_collateral_asset_status_operation& op )const
{ try {
   database& d = db();
   if( _collateral == nullptr || _collateral->enabled == op.enable )
      return void_result();

   d.accrue_user_markets( op.account );
   d.modify( *_collateral, [&op]( collateral_object& c ) {
      c.enabled = op.enable;
   });

   if( !op.enable )
      d.assert_healthy( op.account, "Disabling collateral" );

   ilog( "${u} ${e} ${a} as collateral",
         ("u", op.account)("e", op.enable ? "enabled" : "disabled")("a", asset_label( op.asset )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result ma_token_transfer_evaluator::do_evaluate( const ma_token_transfer_operation& op )
{ try {
   const database& d = db();
   _market = &d.get_market( op.asset );
   _collateral = d.find_collateral( op.from, _market->get_id() );
   REDBANK_ASSERT( _collateral != nullptr, insufficient_balance,
                   "${u} holds no ${s}", ("u", op.from)("s", _market->ma_token_symbol) );
   verify_account_exists( op.to );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result ma_token_transfer_evaluator::do_apply( const ma_token_transfer_operation& op )const
{ try {
   database& d = db();

   d.accrue_user_markets( op.from );

   const scaled_amount_type amount_scaled = get_scaled_liquidity_amount( op.amount, _market->liquidity_index );
   REDBANK_ASSERT( amount_scaled > 0 && amount_scaled <= _collateral->amount_scaled, insufficient_balance,
                   "Cannot transfer ${a} of ${s}, balance is ${b}",
                   ("a", op.amount)("s", _market->ma_token_symbol)
                   ("b", get_underlying_liquidity_amount( _collateral->amount_scaled, _market->liquidity_index )) );

   const bool was_enabled = _collateral->enabled;
   d.decrease_collateral( *_collateral, amount_scaled );
   d.increase_collateral( op.to, *_market, amount_scaled );

   if( was_enabled )
      d.assert_healthy( op.from, "Transfer" );

   dlog( "${f} transferred ${a} ${s} to ${t}", ("f", op.from)("a", op.amount)("s", _market->ma_token_symbol)("t", op.to) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result distribute_protocol_income_evaluator::do_evaluate( const distribute_protocol_income_operation& op )
{ try {
   _market = &db().get_market( op.asset );
   verify_account_exists( op.sender_account );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type distribute_protocol_income_evaluator::do_apply( const distribute_protocol_income_operation& op )const
{ try {
   database& d = db();

   d.accrue_interests( *_market );

   const share_type income = _market->protocol_income_to_distribute;
   const share_type amount = op.amount.valid() ? *op.amount : income;
   REDBANK_ASSERT( amount > 0, invalid_parameter, "Market ${a} has no income to distribute",
                   ("a", asset_label( op.asset )) );
   REDBANK_ASSERT( amount <= income, invalid_parameter,
                   "amount specified exceeds market's income to be distributed (amount: ${a}, income: ${i})",
                   ("a", amount)("i", income) );

   const redbank_config& config = d.get_config();
   const fc::uint128_t total = static_cast<uint64_t>( amount.value );
   const share_type insurance_amount = static_cast<int64_t>( config.insurance_fund_fee_share.mul_floor( total ) );
   const share_type treasury_amount  = static_cast<int64_t>( config.treasury_fee_share.mul_floor( total ) );
   const share_type staking_amount   = amount - insurance_amount - treasury_amount;

   auto mint_to = [&d,this]( account_id_type recipient, const share_type& value ) {
      if( value <= 0 )
         return;
      const scaled_amount_type scaled = get_scaled_liquidity_amount( value, _market->liquidity_index );
      if( scaled > 0 )
         d.increase_collateral( recipient, *_market, scaled );
   };
   mint_to( config.insurance_fund, insurance_amount );
   mint_to( config.treasury, treasury_amount );
   mint_to( config.staking, staking_amount );

   d.modify( *_market, [&amount]( market_object& m ) {
      m.protocol_income_to_distribute -= amount;
   });

   ilog( "Distributed ${a} of ${s} income: insurance fund ${i}, treasury ${t}, staking ${k}",
         ("a", amount)("s", asset_label( op.asset ))("i", insurance_amount)("t", treasury_amount)("k", staking_amount) );
   return amount;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
