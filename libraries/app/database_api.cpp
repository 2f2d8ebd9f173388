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
#include <redbank/app/database_api.hpp>
#include <redbank/chain/exceptions.hpp>

#include <fc/variant.hpp>

#include <boost/range/iterator_range.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

#define REDBANK_API_MAX_LIST_MARKETS_LIMIT 100

namespace redbank { namespace app {

class database_api_impl : public std::enable_shared_from_this<database_api_impl>
{
   public:
      explicit database_api_impl( const redbank::chain::database& db );
      ~database_api_impl();

      // Objects
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      // Markets
      market_api_object         get_market( const asset_info& asset )const;
      vector<market_api_object> list_markets( const optional<uint32_t>& start_after, uint32_t limit )const;
      decimal                   get_liquidity_index( const asset_info& asset )const;
      decimal                   get_borrow_index( const asset_info& asset )const;

      // Users
      vector<user_collateral_api_object>        get_user_collaterals( const string& account_name_or_id )const;
      vector<user_debt_api_object>              get_user_debts( const string& account_name_or_id )const;
      share_type                                get_uncollateralized_loan_limit( const string& account_name_or_id,
                                                                                 const asset_info& asset )const;
      vector<uncollateralized_limit_api_object> get_uncollateralized_loan_limits( const string& account_name_or_id )const;

      const account_object* get_account_from_string( const std::string& name_or_id )const
      {
         FC_ASSERT( name_or_id.size() > 0 );
         const account_object* account = nullptr;
         if( std::isdigit( name_or_id[0] ) )
            account = _db.find( fc::variant( name_or_id, 1 ).as<account_id_type>( 1 ) );
         else
            account = _db.find_account_by_name( name_or_id );
         FC_ASSERT( account, "no such account" );
         return account;
      }

      const redbank::chain::database& _db;
};

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

database_api::database_api( const redbank::chain::database& db )
   : my( new database_api_impl( db ) ) {}

database_api::~database_api() {}

database_api_impl::database_api_impl( const redbank::chain::database& db )
:_db(db)
{
   dlog( "creating database api ${x}", ("x",int64_t(this)) );
}

database_api_impl::~database_api_impl()
{
   dlog( "freeing database api ${x}", ("x",int64_t(this)) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Objects                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::variants database_api::get_objects( const vector<object_id_type>& ids )const
{
   return my->get_objects( ids );
}

fc::variants database_api_impl::get_objects( const vector<object_id_type>& ids )const
{
   fc::variants result;
   result.reserve( ids.size() );

   std::transform( ids.begin(), ids.end(), std::back_inserter(result),
                   [this]( object_id_type id ) -> fc::variant {
      if( auto obj = _db.find_object(id) )
         return obj->to_variant();
      return {};
   });

   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Config                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

redbank_config database_api::get_config()const
{
   return my->_db.get_config();
}

time_point_sec database_api::get_head_time()const
{
   return my->_db.head_time();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Markets                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

market_api_object database_api::get_market( const asset_info& asset )const
{
   return my->get_market( asset );
}

market_api_object database_api_impl::get_market( const asset_info& asset )const
{
   return market_api_object( _db.get_market( asset ), _db.head_time() );
}

vector<market_api_object> database_api::list_markets( const optional<uint32_t>& start_after, uint32_t limit )const
{
   return my->list_markets( start_after, limit );
}

vector<market_api_object> database_api_impl::list_markets( const optional<uint32_t>& start_after, uint32_t limit )const
{
   FC_ASSERT( limit <= REDBANK_API_MAX_LIST_MARKETS_LIMIT,
              "limit can not be greater than ${configured_limit}",
              ("configured_limit", REDBANK_API_MAX_LIST_MARKETS_LIMIT) );

   const auto& idx = _db.get_index_type<market_index>().indices().get<by_market_index>();
   auto itr = start_after.valid() ? idx.upper_bound( *start_after ) : idx.begin();

   const time_point_sec now = _db.head_time();
   vector<market_api_object> result;
   for( ; limit > 0 && itr != idx.end(); ++itr, --limit )
      result.emplace_back( *itr, now );
   return result;
}

decimal database_api_impl::get_liquidity_index( const asset_info& asset )const
{
   return _db.get_market( asset ).get_updated_liquidity_index( _db.head_time() );
}

decimal database_api_impl::get_borrow_index( const asset_info& asset )const
{
   return _db.get_market( asset ).get_updated_borrow_index( _db.head_time() );
}

scaled_amount_type database_api::get_scaled_liquidity_amount( const asset_info& asset, const share_type& amount )const
{
   return redbank::chain::get_scaled_liquidity_amount( amount, my->get_liquidity_index( asset ) );
}

share_type database_api::get_underlying_liquidity_amount( const asset_info& asset,
                                                          const scaled_amount_type& amount_scaled )const
{
   return redbank::chain::get_underlying_liquidity_amount( amount_scaled, my->get_liquidity_index( asset ) );
}

scaled_amount_type database_api::get_scaled_debt_amount( const asset_info& asset, const share_type& amount )const
{
   return redbank::chain::get_scaled_debt_amount( amount, my->get_borrow_index( asset ) );
}

share_type database_api::get_underlying_debt_amount( const asset_info& asset,
                                                     const scaled_amount_type& amount_scaled )const
{
   return redbank::chain::get_underlying_debt_amount( amount_scaled, my->get_borrow_index( asset ) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Users                                                            //
//                                                                  //
//////////////////////////////////////////////////////////////////////

vector<user_collateral_api_object> database_api::get_user_collaterals( const string& account_name_or_id )const
{
   return my->get_user_collaterals( account_name_or_id );
}

vector<user_collateral_api_object> database_api_impl::get_user_collaterals( const string& account_name_or_id )const
{
   const account_id_type account = get_account_from_string( account_name_or_id )->get_id();
   const time_point_sec now = _db.head_time();

   vector<user_collateral_api_object> result;
   const auto& idx = _db.get_index_type<collateral_index>().indices().get<by_account_market>();
   auto range = idx.equal_range( boost::make_tuple( account ) );
   for( const collateral_object& c : boost::make_iterator_range( range.first, range.second ) )
   {
      const market_object& m = _db.get( c.market );
      user_collateral_api_object entry;
      entry.asset = m.asset;
      entry.ma_token_symbol = m.ma_token_symbol;
      entry.amount_scaled = c.amount_scaled;
      entry.amount = redbank::chain::get_underlying_liquidity_amount( c.amount_scaled,
                                                                      m.get_updated_liquidity_index( now ) );
      entry.enabled = c.enabled;
      result.push_back( entry );
   }
   return result;
}

vector<user_debt_api_object> database_api::get_user_debts( const string& account_name_or_id )const
{
   return my->get_user_debts( account_name_or_id );
}

vector<user_debt_api_object> database_api_impl::get_user_debts( const string& account_name_or_id )const
{
   const account_id_type account = get_account_from_string( account_name_or_id )->get_id();
   const time_point_sec now = _db.head_time();

   vector<user_debt_api_object> result;
   const auto& idx = _db.get_index_type<debt_index>().indices().get<by_account_market>();
   auto range = idx.equal_range( boost::make_tuple( account ) );
   for( const debt_object& d : boost::make_iterator_range( range.first, range.second ) )
   {
      const market_object& m = _db.get( d.market );
      user_debt_api_object entry;
      entry.asset = m.asset;
      entry.amount_scaled = d.amount_scaled;
      entry.amount = redbank::chain::get_underlying_debt_amount( d.amount_scaled, m.get_updated_borrow_index( now ) );
      entry.uncollateralized = d.uncollateralized;
      result.push_back( entry );
   }
   return result;
}

share_type database_api::get_uncollateralized_loan_limit( const string& account_name_or_id,
                                                          const asset_info& asset )const
{
   return my->get_uncollateralized_loan_limit( account_name_or_id, asset );
}

share_type database_api_impl::get_uncollateralized_loan_limit( const string& account_name_or_id,
                                                               const asset_info& asset )const
{
   const account_id_type account = get_account_from_string( account_name_or_id )->get_id();
   return _db.get_uncollateralized_limit( account, _db.get_market( asset ).get_id() );
}

vector<uncollateralized_limit_api_object> database_api::get_uncollateralized_loan_limits(
      const string& account_name_or_id )const
{
   return my->get_uncollateralized_loan_limits( account_name_or_id );
}

vector<uncollateralized_limit_api_object> database_api_impl::get_uncollateralized_loan_limits(
      const string& account_name_or_id )const
{
   const account_id_type account = get_account_from_string( account_name_or_id )->get_id();

   vector<uncollateralized_limit_api_object> result;
   const auto& idx = _db.get_index_type<uncollateralized_limit_index>().indices().get<by_account_market>();
   auto range = idx.equal_range( boost::make_tuple( account ) );
   for( const uncollateralized_limit_object& l : boost::make_iterator_range( range.first, range.second ) )
      result.push_back( uncollateralized_limit_api_object{ _db.get( l.market ).asset, l.limit } );
   return result;
}

user_position database_api::get_user_position( const string& account_name_or_id )const
{
   return my->_db.get_user_position( my->get_account_from_string( account_name_or_id )->get_id() );
}

share_type database_api::get_account_balance( const string& account_name_or_id, const asset_info& asset )const
{
   return my->_db.get_balance( my->get_account_from_string( account_name_or_id )->get_id(), asset );
}

} } // redbank::app
