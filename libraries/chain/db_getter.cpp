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
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return get( dynamic_global_property_id_type() );
}

const redbank_config& database::get_config()const
{
   return get_global_properties().config;
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

const account_object* database::find_account_by_name( const string& name )const
{
   const auto& idx = get_index_type<account_index>().indices().get<by_name>();
   auto itr = idx.find( name );
   return itr == idx.end() ? nullptr : &*itr;
}

const account_object& database::get_account_by_name( const string& name )const
{
   const account_object* account = find_account_by_name( name );
   FC_ASSERT( account != nullptr, "Unknown account ${n}", ("n", name) );
   return *account;
}

const market_object* database::find_market( const asset_info& asset )const
{
   const auto& idx = get_index_type<market_index>().indices().get<by_asset>();
   auto itr = idx.find( asset_reference( asset ) );
   return itr == idx.end() ? nullptr : &*itr;
}

const market_object& database::get_market( const asset_info& asset )const
{
   const market_object* market = find_market( asset );
   REDBANK_ASSERT( market != nullptr, asset_not_initialized,
                   "Asset not initialized: ${a}", ("a", asset_label( asset )) );
   return *market;
}

const market_object* database::find_market_by_ma_token( const string& symbol )const
{
   const auto& idx = get_index_type<market_index>().indices().get<by_ma_token>();
   auto itr = idx.find( symbol );
   return itr == idx.end() ? nullptr : &*itr;
}

const collateral_object* database::find_collateral( account_id_type owner, market_id_type market )const
{
   const auto& idx = get_index_type<collateral_index>().indices().get<by_account_market>();
   auto itr = idx.find( boost::make_tuple( owner, market ) );
   return itr == idx.end() ? nullptr : &*itr;
}

const debt_object* database::find_debt( account_id_type borrower, market_id_type market )const
{
   const auto& idx = get_index_type<debt_index>().indices().get<by_account_market>();
   auto itr = idx.find( boost::make_tuple( borrower, market ) );
   return itr == idx.end() ? nullptr : &*itr;
}

share_type database::get_uncollateralized_limit( account_id_type user, market_id_type market )const
{
   const auto& idx = get_index_type<uncollateralized_limit_index>().indices().get<by_account_market>();
   auto itr = idx.find( boost::make_tuple( user, market ) );
   return itr == idx.end() ? share_type(0) : itr->limit;
}

bool database::has_positive_uncollateralized_limit( account_id_type user )const
{
   const auto& idx = get_index_type<uncollateralized_limit_index>().indices().get<by_account_market>();
   auto range = idx.equal_range( boost::make_tuple( user ) );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      if( itr->limit > 0 )
         return true;
   }
   return false;
}

decimal database::get_price( const asset_info& asset )const
{
   return _price_oracle->get_price( asset );
}

} }
