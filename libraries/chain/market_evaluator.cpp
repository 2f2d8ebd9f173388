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
#include <redbank/chain/market_evaluator.hpp>
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

void_result init_asset_evaluator::do_evaluate( const init_asset_operation& op )
{ try {
   const database& d = db();
   verify_owner( op.owner );

   REDBANK_ASSERT( d.find_market( op.asset ) == nullptr, init_asset_already_initialized,
                   "Asset already initialized: ${a}", ("a", asset_label( op.asset )) );

   _params = op.params.to_market_parameters();
   _params.validate();

   _symbol = op.symbol.valid() ? *op.symbol : REDBANK_MA_TOKEN_SYMBOL_PREFIX + asset_label( op.asset );
   FC_ASSERT( d.find_market_by_ma_token( _symbol ) == nullptr, "ma-token symbol ${s} is already in use",
              ("s", _symbol) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type init_asset_evaluator::do_apply( const init_asset_operation& op )const
{ try {
   database& d = db();
   const global_property_object& gpo = d.get_global_properties();
   const uint32_t market_index = gpo.market_count;

   const market_object& market = d.create<market_object>( [&]( market_object& m ) {
      m.asset = op.asset;
      m.asset_ref = asset_reference( op.asset );
      m.index = market_index;
      m.ma_token_symbol = _symbol;
      m.set_parameters( _params );
      m.borrow_rate = *op.params.initial_borrow_rate;
      m.interests_last_updated = d.head_time();
   });

   d.modify( gpo, []( global_property_object& p ) {
      ++p.market_count;
   });

   ilog( "Initialized market ${i} for ${a} with ma-token ${s}",
         ("i", market_index)("a", asset_label( op.asset ))("s", _symbol) );
   return market.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_asset_evaluator::do_evaluate( const update_asset_operation& op )
{ try {
   verify_owner( op.owner );
   _market = &db().get_market( op.asset );

   _params = _market->get_parameters();
   op.params.apply_to( _params );
   _params.validate();

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_asset_evaluator::do_apply( const update_asset_operation& op )const
{ try {
   database& d = db();

   // interest up to now accrues at the old parameters
   d.accrue_interests( *_market );
   d.modify( *_market, [this]( market_object& m ) {
      m.set_parameters( _params );
   });
   d.update_interest_rates( *_market );

   ilog( "Updated market parameters of ${a}", ("a", asset_label( op.asset )) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_config_evaluator::do_evaluate( const update_config_operation& op )
{ try {
   verify_owner( op.owner );

   _config = db().get_config();
   op.config.apply_to( _config );
   _config.validate();

   verify_account_exists( _config.owner );
   verify_account_exists( _config.insurance_fund );
   verify_account_exists( _config.treasury );
   verify_account_exists( _config.staking );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result update_config_evaluator::do_apply( const update_config_operation& op )const
{ try {
   database& d = db();
   d.modify( d.get_global_properties(), [this]( global_property_object& p ) {
      p.config = _config;
   });
   ilog( "Updated configuration: ${c}", ("c", _config) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result set_asset_price_evaluator::do_evaluate( const set_asset_price_operation& op )const
{ try {
   verify_owner( op.owner );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result set_asset_price_evaluator::do_apply( const set_asset_price_operation& op )const
{ try {
   database& d = db();
   const string ref = asset_reference( op.asset );
   const time_point_sec now = d.head_time();

   const auto& idx = d.get_index_type<price_feed_index>().indices().get<by_asset_ref>();
   auto itr = idx.find( ref );
   if( itr == idx.end() )
   {
      d.create<price_feed_object>( [&]( price_feed_object& p ) {
         p.asset = op.asset;
         p.asset_ref = ref;
         p.price = op.price;
         p.last_update = now;
      });
   }
   else
   {
      d.modify( *itr, [&op,now]( price_feed_object& p ) {
         p.price = op.price;
         p.last_update = now;
      });
   }

   dlog( "Price of ${a} set to ${p}", ("a", asset_label( op.asset ))("p", op.price) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
