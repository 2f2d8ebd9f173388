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
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

void database::accrue_interests( const market_object& market )
{ try {
   const time_point_sec now = head_time();
   if( market.interests_last_updated >= now )
      return;

   const decimal new_borrow_index    = market.get_updated_borrow_index( now );
   const decimal new_liquidity_index = market.get_updated_liquidity_index( now );

   // the reserve factor's share of the interest accrued on all debt goes to the protocol
   const share_type previous_debt_total = get_underlying_debt_amount( market.debt_total_scaled, market.borrow_index );
   const share_type new_debt_total      = get_underlying_debt_amount( market.debt_total_scaled, new_borrow_index );
   share_type new_protocol_income = 0;
   if( new_debt_total > previous_debt_total )
   {
      const fc::uint128_t interest_accrued = static_cast<uint64_t>( ( new_debt_total - previous_debt_total ).value );
      new_protocol_income = static_cast<int64_t>( market.reserve_factor.mul_floor( interest_accrued ) );
   }

   modify( market, [&]( market_object& m ) {
      m.borrow_index = new_borrow_index;
      m.liquidity_index = new_liquidity_index;
      m.protocol_income_to_distribute += new_protocol_income;
      m.interests_last_updated = now;
   });

   dlog( "Accrued interest on ${a}: borrow_index ${bi}, liquidity_index ${li}, protocol income ${p}",
         ("a", asset_label( market.asset ))("bi", new_borrow_index)("li", new_liquidity_index)
         ("p", new_protocol_income) );
} FC_CAPTURE_AND_RETHROW( (market.asset) ) }

void database::update_interest_rates( const market_object& market )
{ try {
   const share_type total_debt = get_underlying_debt_amount( market.debt_total_scaled, market.borrow_index );
   const fc::uint128_t debt = static_cast<uint64_t>( total_debt.value );
   const fc::uint128_t total = debt + static_cast<uint64_t>( market.available_liquidity.value );

   const decimal utilization = ( total == 0 ) ? decimal::zero() : decimal::from_ratio( debt, total );
   const decimal borrow_rate = get_updated_borrow_rate( market.interest_rate_strategy, market.borrow_rate,
                                                        utilization );
   const decimal liquidity_rate = get_liquidity_rate( borrow_rate, utilization, market.reserve_factor );

   modify( market, [&]( market_object& m ) {
      m.borrow_rate = borrow_rate;
      m.liquidity_rate = liquidity_rate;
   });
} FC_CAPTURE_AND_RETHROW( (market.asset) ) }

void database::accrue_user_markets( account_id_type user )
{
   flat_set<market_id_type> markets;

   const auto& coll_idx = get_index_type<collateral_index>().indices().get<by_account_market>();
   auto coll_range = coll_idx.equal_range( boost::make_tuple( user ) );
   for( auto itr = coll_range.first; itr != coll_range.second; ++itr )
      markets.insert( itr->market );

   const auto& debt_idx = get_index_type<debt_index>().indices().get<by_account_market>();
   auto debt_range = debt_idx.equal_range( boost::make_tuple( user ) );
   for( auto itr = debt_range.first; itr != debt_range.second; ++itr )
      markets.insert( itr->market );

   for( const auto& id : markets )
      accrue_interests( get( id ) );
}

} }
