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
#include <redbank/app/api_objects.hpp>

namespace redbank { namespace app {

market_api_object::market_api_object( const market_object& m, time_point_sec now )
: id( m.get_id() ),
  asset( m.asset ),
  index( m.index ),
  ma_token_symbol( m.ma_token_symbol ),
  borrow_index( m.get_updated_borrow_index( now ) ),
  liquidity_index( m.get_updated_liquidity_index( now ) ),
  borrow_rate( m.borrow_rate ),
  liquidity_rate( m.liquidity_rate ),
  params( m.get_parameters() ),
  interests_last_updated( m.interests_last_updated ),
  collateral_total_scaled( m.collateral_total_scaled ),
  debt_total_scaled( m.debt_total_scaled ),
  available_liquidity( m.available_liquidity ),
  protocol_income_to_distribute( m.protocol_income_to_distribute ),
  bad_debt( m.bad_debt )
{
   collateral_total = get_underlying_liquidity_amount( collateral_total_scaled, liquidity_index );
   debt_total = get_underlying_debt_amount( debt_total_scaled, borrow_index );
}

} } // redbank::app
