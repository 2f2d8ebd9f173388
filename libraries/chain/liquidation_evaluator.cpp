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
#include <redbank/chain/liquidation_evaluator.hpp>
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>

namespace redbank { namespace chain {

using boost::multiprecision::uint256_t;

static const uint256_t fractional256( REDBANK_DECIMAL_FRACTIONAL );

static share_type to_share( const uint256_t& v )
{
   REDBANK_ASSERT( v <= uint256_t( REDBANK_MAX_SHARE_SUPPLY ), invalid_parameter,
                   "Liquidation amount overflow", ("value", v.str()) );
   return static_cast<int64_t>( v );
}

share_type calculate_liquidated_collateral( const share_type& debt_repaid, const decimal& liquidation_bonus,
                                            const decimal& debt_price, const decimal& collateral_price )
{
   FC_ASSERT( !collateral_price.is_zero(), "Collateral price must not be zero" );
   uint256_t num = uint256_t( debt_repaid.value );
   num *= fractional256 + uint256_t( liquidation_bonus.atomics() );
   num *= uint256_t( debt_price.atomics() );
   const uint256_t den = fractional256 * uint256_t( collateral_price.atomics() );
   return to_share( num / den );
}

share_type calculate_max_debt_repayable( const share_type& collateral_balance, const decimal& liquidation_bonus,
                                         const decimal& debt_price, const decimal& collateral_price )
{
   FC_ASSERT( !debt_price.is_zero(), "Debt price must not be zero" );
   uint256_t num = uint256_t( collateral_balance.value );
   num *= uint256_t( collateral_price.atomics() );
   num *= fractional256;
   const uint256_t den = uint256_t( debt_price.atomics() ) * ( fractional256 + uint256_t( liquidation_bonus.atomics() ) );
   return to_share( num / den );
}

void_result liquidate_evaluator::do_evaluate( const liquidate_operation& op )
{ try {
   const database& d = db();
   _collateral_market = &d.get_market( op.collateral_asset );
   _debt_market = &d.get_market( op.debt_asset );
   verify_account_exists( op.user );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

liquidation_result liquidate_evaluator::do_apply( const liquidate_operation& op )const
{ try {
   database& d = db();
   const market_object& coll_market = *_collateral_market;
   const market_object& debt_market = *_debt_market;

   d.accrue_interests( coll_market );
   d.accrue_interests( debt_market );
   d.accrue_user_markets( op.user );

   REDBANK_ASSERT( !d.has_positive_uncollateralized_limit( op.user ), liquidate_positive_uncollateralized_limit,
                   "user has a positive uncollateralized loan limit and thus cannot be liquidated",
                   ("user", op.user) );

   const collateral_object* collateral = d.find_collateral( op.user, coll_market.get_id() );
   FC_ASSERT( collateral != nullptr && collateral->enabled,
              "User does not have an enabled collateral position in ${a}",
              ("a", asset_label( op.collateral_asset )) );
   const debt_object* debt = d.find_debt( op.user, debt_market.get_id() );
   FC_ASSERT( debt != nullptr, "User has no outstanding debt in ${a}", ("a", asset_label( op.debt_asset )) );

   const user_position position = d.get_user_position( op.user );
   REDBANK_ASSERT( position.health.is_borrowing() && position.health.health_factor < decimal::one(),
                   liquidate_health_factor_ok,
                   "User's health factor is not less than 1 and thus cannot be liquidated",
                   ("user", op.user)("health_factor", position.health.health_factor) );

   const decimal collateral_price = d.get_price( op.collateral_asset );
   const decimal debt_price = d.get_price( op.debt_asset );
   const decimal close_factor = d.get_config().close_factor;

   const share_type debt_amount = get_underlying_debt_amount( debt->amount_scaled, debt_market.borrow_index );
   const share_type collateral_balance = get_underlying_liquidity_amount( collateral->amount_scaled,
                                                                          coll_market.liquidity_index );

   liquidation_result result;
   const share_type max_repayable = static_cast<int64_t>(
         close_factor.mul_floor( static_cast<uint64_t>( debt_amount.value ) ) );
   result.debt_amount_repaid = std::min( op.amount, max_repayable );
   result.collateral_amount_liquidated = calculate_liquidated_collateral( result.debt_amount_repaid,
                                                                          coll_market.liquidation_bonus,
                                                                          debt_price, collateral_price );
   if( result.collateral_amount_liquidated > collateral_balance )
   {
      result.collateral_amount_liquidated = collateral_balance;
      result.debt_amount_repaid = calculate_max_debt_repayable( collateral_balance, coll_market.liquidation_bonus,
                                                                debt_price, collateral_price );
   }
   REDBANK_ASSERT( result.debt_amount_repaid > 0, liquidate_nothing_to_repay,
                   "Liquidation would repay nothing, the debt or the collateral is too small",
                   ("debt", debt_amount)("collateral", collateral_balance) );
   result.refund_amount = op.amount - result.debt_amount_repaid;

   collect_funds( op.liquidator, op.debt_asset, op.amount );

   // debt side
   const scaled_amount_type debt_burn = result.debt_amount_repaid >= debt_amount
                                      ? debt->amount_scaled
                                      : get_scaled_debt_amount_floor( result.debt_amount_repaid, debt_market.borrow_index );
   d.decrease_debt( *debt, debt_burn );
   d.modify( debt_market, [&result]( market_object& m ) {
      m.available_liquidity += result.debt_amount_repaid;
   });

   // collateral side
   scaled_amount_type collateral_burn = collateral->amount_scaled;
   if( result.collateral_amount_liquidated < collateral_balance )
      collateral_burn = std::min( collateral_burn, get_scaled_liquidity_amount( result.collateral_amount_liquidated,
                                                                                 coll_market.liquidity_index ) );
   d.decrease_collateral( *collateral, collateral_burn );

   if( op.receive_ma_token )
   {
      if( collateral_burn > 0 )
         d.increase_collateral( op.liquidator, coll_market, collateral_burn );
      result.collateral_amount_received = result.collateral_amount_liquidated;
   }
   else
   {
      REDBANK_ASSERT( coll_market.available_liquidity >= result.collateral_amount_liquidated, insufficient_liquidity,
                      "Not enough liquidity in the ${a} market to pay out ${m} of liquidated collateral",
                      ("a", asset_label( op.collateral_asset ))("m", result.collateral_amount_liquidated) );
      d.modify( coll_market, [&result]( market_object& m ) {
         m.available_liquidity -= result.collateral_amount_liquidated;
      });
      if( result.collateral_amount_liquidated > 0 )
         result.collateral_amount_received = d.pay_out( op.liquidator, op.collateral_asset,
                                                        result.collateral_amount_liquidated );
   }

   // bad debt: nothing left to seize, every collateralized debt of the user is written off
   const auto& coll_idx = d.get_index_type<collateral_index>().indices().get<by_account_market>();
   auto range = coll_idx.equal_range( boost::make_tuple( op.user ) );
   const bool has_collateral = std::any_of( range.first, range.second,
                                            []( const collateral_object& c ) { return c.enabled; } );
   flat_set<market_id_type> written_off_markets;
   if( !has_collateral )
   {
      const auto& debt_idx = d.get_index_type<debt_index>().indices().get<by_account_market>();
      auto debt_range = debt_idx.equal_range( boost::make_tuple( op.user ) );
      vector<const debt_object*> bad_debts;
      for( auto itr = debt_range.first; itr != debt_range.second; ++itr )
         if( !itr->uncollateralized )
            bad_debts.push_back( &*itr );

      for( const debt_object* bad : bad_debts )
      {
         const market_object& market = d.get( bad->market );
         const share_type amount = get_underlying_debt_amount( bad->amount_scaled, market.borrow_index );
         written_off_markets.insert( market.get_id() );
         d.decrease_debt( *bad, bad->amount_scaled );
         d.modify( market, [&amount]( market_object& m ) {
            m.bad_debt += amount;
         });
         if( &market == &debt_market )
            result.bad_debt_written_off = amount;
         wlog( "Wrote off ${b} ${a} of bad debt owed by ${u}",
               ("b", amount)("a", asset_label( market.asset ))("u", op.user) );
      }
   }

   if( result.refund_amount > 0 )
      d.pay_out( op.liquidator, op.debt_asset, result.refund_amount );

   written_off_markets.insert( coll_market.get_id() );
   written_off_markets.insert( debt_market.get_id() );
   for( const auto& id : written_off_markets )
      d.update_interest_rates( d.get( id ) );

   ilog( "${l} liquidated ${u}: repaid ${r} ${da}, seized ${c} ${ca}, refunded ${f}",
         ("l", op.liquidator)("u", op.user)("r", result.debt_amount_repaid)("da", asset_label( op.debt_asset ))
         ("c", result.collateral_amount_liquidated)("ca", asset_label( op.collateral_asset ))
         ("f", result.refund_amount) );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
