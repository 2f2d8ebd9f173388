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

#include <map>

namespace redbank { namespace chain {

const user_asset_position* user_position::find_asset( const asset_info& a )const
{
   for( const auto& line : assets )
   {
      if( line.asset == a )
         return &line;
   }
   return nullptr;
}

user_position database::get_user_position( account_id_type user )const
{ try {
   const time_point_sec now = head_time();
   std::map<market_id_type, user_asset_position> lines;

   auto line_for = [this,&lines]( market_id_type id ) -> user_asset_position& {
      auto itr = lines.find( id );
      if( itr != lines.end() )
         return itr->second;
      const market_object& m = get( id );
      user_asset_position& line = lines[id];
      line.asset              = m.asset;
      line.market             = id;
      line.max_loan_to_value  = m.max_loan_to_value;
      line.maintenance_margin = m.maintenance_margin;
      line.liquidation_bonus  = m.liquidation_bonus;
      return line;
   };

   const auto& coll_idx = get_index_type<collateral_index>().indices().get<by_account_market>();
   auto coll_range = coll_idx.equal_range( boost::make_tuple( user ) );
   for( auto itr = coll_range.first; itr != coll_range.second; ++itr )
   {
      user_asset_position& line = line_for( itr->market );
      line.collateral_amount = get_underlying_liquidity_amount( itr->amount_scaled,
                                                                get( itr->market ).get_updated_liquidity_index( now ) );
      line.collateral_enabled = itr->enabled;
   }

   const auto& debt_idx = get_index_type<debt_index>().indices().get<by_account_market>();
   auto debt_range = debt_idx.equal_range( boost::make_tuple( user ) );
   for( auto itr = debt_range.first; itr != debt_range.second; ++itr )
   {
      user_asset_position& line = line_for( itr->market );
      line.debt_amount = get_underlying_debt_amount( itr->amount_scaled,
                                                     get( itr->market ).get_updated_borrow_index( now ) );
      line.uncollateralized = itr->uncollateralized;
   }

   user_position result;
   result.assets.reserve( lines.size() );
   for( auto& entry : lines )
   {
      user_asset_position& line = entry.second;
      line.price = get_price( line.asset );

      if( line.collateral_enabled )
      {
         line.collateral_value = line.price.mul_floor( static_cast<uint64_t>( line.collateral_amount.value ) );
         result.total_collateral_value += line.collateral_value;
         result.max_debt_value += line.max_loan_to_value.mul_floor( line.collateral_value );
         result.weighted_maintenance_margin_value += line.maintenance_margin.mul_floor( line.collateral_value );
      }

      if( line.debt_amount > 0 )
      {
         line.debt_value = line.price.mul_floor( static_cast<uint64_t>( line.debt_amount.value ) );
         result.total_debt_value += line.debt_value;
         if( !line.uncollateralized )
            result.total_collateralized_debt_value += line.debt_value;
      }

      result.assets.push_back( line );
   }

   if( result.total_collateralized_debt_value == 0 )
      result.health.status = not_borrowing;
   else
   {
      result.health.status = borrowing;
      result.health.health_factor = decimal::from_ratio( result.weighted_maintenance_margin_value,
                                                         result.total_collateralized_debt_value );
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (user) ) }

void database::assert_healthy( account_id_type user, const char* action )const
{
   const user_position position = get_user_position( user );
   REDBANK_ASSERT( !position.health.is_borrowing() || position.health.health_factor >= decimal::one(),
                   health_check_failed,
                   "${action} would leave ${u} with a health factor of ${h}, which is below 1",
                   ("action", action)("u", user)("h", position.health.health_factor) );
}

const collateral_object& database::increase_collateral( account_id_type owner, const market_object& market,
                                                        const scaled_amount_type& amount_scaled )
{
   modify( market, [&amount_scaled]( market_object& m ) {
      m.collateral_total_scaled += amount_scaled;
   });

   const collateral_object* existing = find_collateral( owner, market.get_id() );
   if( existing != nullptr )
   {
      modify( *existing, [&amount_scaled]( collateral_object& c ) {
         c.amount_scaled += amount_scaled;
      });
      return *existing;
   }

   return create<collateral_object>( [&]( collateral_object& c ) {
      c.owner = owner;
      c.market = market.get_id();
      c.amount_scaled = amount_scaled;
      c.enabled = true;
   });
}

void database::decrease_collateral( const collateral_object& collateral, const scaled_amount_type& amount_scaled )
{
   FC_ASSERT( collateral.amount_scaled >= amount_scaled, "Cannot burn more ma-token shares than held",
              ("held", collateral.amount_scaled)("burn", amount_scaled) );

   modify( get( collateral.market ), [&amount_scaled]( market_object& m ) {
      m.collateral_total_scaled -= amount_scaled;
   });

   if( collateral.amount_scaled == amount_scaled )
      remove( collateral );
   else
      modify( collateral, [&amount_scaled]( collateral_object& c ) {
         c.amount_scaled -= amount_scaled;
      });
}

const debt_object& database::increase_debt( account_id_type borrower, const market_object& market,
                                            const scaled_amount_type& amount_scaled, bool uncollateralized )
{
   modify( market, [&amount_scaled]( market_object& m ) {
      m.debt_total_scaled += amount_scaled;
   });

   const debt_object* existing = find_debt( borrower, market.get_id() );
   if( existing != nullptr )
   {
      modify( *existing, [&amount_scaled,uncollateralized]( debt_object& d ) {
         d.amount_scaled += amount_scaled;
         d.uncollateralized = uncollateralized;
      });
      return *existing;
   }

   return create<debt_object>( [&]( debt_object& d ) {
      d.borrower = borrower;
      d.market = market.get_id();
      d.amount_scaled = amount_scaled;
      d.uncollateralized = uncollateralized;
   });
}

void database::decrease_debt( const debt_object& debt, const scaled_amount_type& amount_scaled )
{
   FC_ASSERT( debt.amount_scaled >= amount_scaled, "Cannot repay more debt shares than owed",
              ("owed", debt.amount_scaled)("repay", amount_scaled) );

   modify( get( debt.market ), [&amount_scaled]( market_object& m ) {
      m.debt_total_scaled -= amount_scaled;
   });

   if( debt.amount_scaled == amount_scaled )
      remove( debt );
   else
      modify( debt, [&amount_scaled]( debt_object& d ) {
         d.amount_scaled -= amount_scaled;
      });
}

} }
