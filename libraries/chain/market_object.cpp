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
#include <redbank/chain/market_object.hpp>

namespace redbank { namespace chain {

market_parameters market_object::get_parameters()const
{
   market_parameters params;
   params.max_loan_to_value      = max_loan_to_value;
   params.reserve_factor         = reserve_factor;
   params.maintenance_margin     = maintenance_margin;
   params.liquidation_bonus      = liquidation_bonus;
   params.interest_rate_strategy = interest_rate_strategy;
   return params;
}

void market_object::set_parameters( const market_parameters& params )
{
   max_loan_to_value      = params.max_loan_to_value;
   reserve_factor         = params.reserve_factor;
   maintenance_margin     = params.maintenance_margin;
   liquidation_bonus      = params.liquidation_bonus;
   interest_rate_strategy = params.interest_rate_strategy;
}

decimal market_object::get_updated_borrow_index( time_point_sec now )const
{
   if( now <= interests_last_updated )
      return borrow_index;
   return calculate_applied_linear_interest_rate( borrow_index, borrow_rate,
                                                  now.sec_since_epoch() - interests_last_updated.sec_since_epoch() );
}

decimal market_object::get_updated_liquidity_index( time_point_sec now )const
{
   if( now <= interests_last_updated )
      return liquidity_index;
   return calculate_applied_linear_interest_rate( liquidity_index, liquidity_rate,
                                                  now.sec_since_epoch() - interests_last_updated.sec_since_epoch() );
}

decimal calculate_applied_linear_interest_rate( const decimal& index, const decimal& rate, uint32_t time_elapsed )
{
   if( rate.is_zero() || time_elapsed == 0 )
      return index;
   const decimal accumulated = rate * decimal::from_ratio( time_elapsed, REDBANK_SECONDS_PER_YEAR );
   return index * ( decimal::one() + accumulated );
}

static share_type to_share( const fc::uint128_t& amount )
{
   FC_ASSERT( amount <= fc::uint128_t( REDBANK_MAX_SHARE_SUPPLY ), "Amount overflow", ("amount", amount) );
   return static_cast<int64_t>( amount );
}

static fc::uint128_t to_unsigned( const share_type& amount )
{
   FC_ASSERT( amount >= 0, "Negative amount", ("amount", amount) );
   return static_cast<uint64_t>( amount.value );
}

scaled_amount_type get_scaled_liquidity_amount( const share_type& amount, const decimal& liquidity_index )
{
   return liquidity_index.div_floor( to_unsigned( amount ) * REDBANK_MA_TOKEN_SCALING_FACTOR );
}

scaled_amount_type get_scaled_liquidity_amount_ceil( const share_type& amount, const decimal& liquidity_index )
{
   return liquidity_index.div_ceil( to_unsigned( amount ) * REDBANK_MA_TOKEN_SCALING_FACTOR );
}

share_type get_underlying_liquidity_amount( const scaled_amount_type& amount_scaled, const decimal& liquidity_index )
{
   return to_share( liquidity_index.mul_floor( amount_scaled ) / REDBANK_MA_TOKEN_SCALING_FACTOR );
}

scaled_amount_type get_scaled_debt_amount( const share_type& amount, const decimal& borrow_index )
{
   return borrow_index.div_ceil( to_unsigned( amount ) * REDBANK_MA_TOKEN_SCALING_FACTOR );
}

scaled_amount_type get_scaled_debt_amount_floor( const share_type& amount, const decimal& borrow_index )
{
   return borrow_index.div_floor( to_unsigned( amount ) * REDBANK_MA_TOKEN_SCALING_FACTOR );
}

share_type get_underlying_debt_amount( const scaled_amount_type& amount_scaled, const decimal& borrow_index )
{
   const fc::uint128_t product = borrow_index.mul_ceil( amount_scaled );
   fc::uint128_t result = product / REDBANK_MA_TOKEN_SCALING_FACTOR;
   if( product % REDBANK_MA_TOKEN_SCALING_FACTOR != 0 )
      ++result;
   return to_share( result );
}

} } // redbank::chain
