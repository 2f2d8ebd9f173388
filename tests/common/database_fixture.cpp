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
#include <boost/test/unit_test.hpp>

#include <redbank/chain/market_object.hpp>
#include <redbank/chain/position_object.hpp>

#include <exception>
#include <iostream>
#include <map>

#include "database_fixture.hpp"

uint32_t REDBANK_TESTING_GENESIS_TIMESTAMP = 1609459200;

namespace redbank { namespace chain {

namespace buf = boost::unit_test::framework;

database_fixture::database_fixture()
   : genesis_state( make_genesis() ),
     current_test_name( buf::current_test_case().p_name.value ),
     current_suite_name( buf::get<boost::unit_test::test_suite>( buf::current_test_case().p_parent_id ).p_name.value )
{
   try {
   int argc = buf::master_test_suite().argc;
   char** argv = buf::master_test_suite().argv;
   for( int i=1; i<argc; i++ )
   {
      const std::string arg = argv[i];
      if( arg == "--record-assert-trip" )
         fc::enable_record_assert_trip = true;
      if( arg == "--show-test-names" )
         std::cout << "running test " << current_test_name << std::endl;
   }

   db.init_genesis( genesis_state );

   owner_id          = db.get_account_by_name( "owner" ).get_id();
   insurance_fund_id = db.get_account_by_name( "insurance-fund" ).get_id();
   treasury_id       = db.get_account_by_name( "treasury" ).get_id();
   staking_id        = db.get_account_by_name( "staking" ).get_id();
   } catch ( const fc::exception& e )
   {
      edump( (e.to_detail_string()) );
      throw;
   }
}

database_fixture::~database_fixture()
{
   // bail out of the check if the test already failed
   if( !std::uncaught_exceptions() )
      verify_market_totals();
}

genesis_state_type database_fixture::make_genesis()
{
   genesis_state_type genesis;
   genesis.initial_timestamp = time_point_sec( REDBANK_TESTING_GENESIS_TIMESTAMP );
   for( const char* name : { "owner", "insurance-fund", "treasury", "staking" } )
      genesis.initial_accounts.push_back( { name } );

   auto& config = genesis.initial_config;
   config.owner_name = "owner";
   config.close_factor = decimal::percent( 50 );
   config.insurance_fund_fee_share = decimal::percent( 10 );
   config.treasury_fee_share = decimal::percent( 20 );
   config.insurance_fund_name = "insurance-fund";
   config.treasury_name = "treasury";
   config.staking_name = "staking";
   return genesis;
}

linear_interest_rate_model database_fixture::default_rate_model()
{
   linear_interest_rate_model model;
   model.optimal_utilization_rate = decimal::percent( 80 );
   model.base = decimal::zero();
   model.slope_1 = decimal::percent( 7 );
   model.slope_2 = decimal::percent( 45 );
   return model;
}

asset_params database_fixture::default_asset_params()
{
   asset_params params;
   params.initial_borrow_rate = decimal::percent( 5 );
   params.max_loan_to_value = decimal::percent( 55 );
   params.reserve_factor = decimal::percent( 10 );
   params.maintenance_margin = decimal::percent( 65 );
   params.liquidation_bonus = decimal::percent( 10 );
   params.interest_rate_strategy = default_rate_model();
   return params;
}

const account_object& database_fixture::create_account( const string& name )
{ try {
   account_create_operation op;
   op.name = name;
   const operation_result result = db.push_operation( op );
   return db.get<account_object>( result.get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (name) ) }

const account_object& database_fixture::get_account( const string& name )const
{
   return db.get_account_by_name( name );
}

void database_fixture::fund( account_id_type who, const asset_info& asset, share_type amount )
{
   db.adjust_balance( who, asset, amount );
}

share_type database_fixture::get_balance( account_id_type who, const asset_info& asset )const
{
   return db.get_balance( who, asset );
}

const market_object& database_fixture::init_market( const asset_info& asset, const asset_params& params,
                                                    const optional<string>& symbol )
{ try {
   init_asset_operation op;
   op.owner = owner_id;
   op.asset = asset;
   op.params = params;
   op.symbol = symbol;
   db.push_operation( op );
   return db.get_market( asset );
} FC_CAPTURE_AND_RETHROW( (asset)(params) ) }

void database_fixture::update_market( const asset_info& asset, const asset_params& params )
{
   update_asset_operation op;
   op.owner = owner_id;
   op.asset = asset;
   op.params = params;
   db.push_operation( op );
}

void database_fixture::update_config( const config_params& config )
{
   update_config_operation op;
   op.owner = owner_id;
   op.config = config;
   db.push_operation( op );
}

void database_fixture::set_price( const asset_info& asset, const decimal& price )
{
   set_asset_price_operation op;
   op.owner = owner_id;
   op.asset = asset;
   op.price = price;
   db.push_operation( op );
}

void database_fixture::deposit( account_id_type who, const asset_info& asset, share_type amount,
                                const optional<account_id_type>& on_behalf_of )
{
   deposit_operation op;
   op.depositor = who;
   op.asset = asset;
   op.amount = amount;
   op.on_behalf_of = on_behalf_of;
   db.push_operation( op );
}

share_type database_fixture::withdraw( account_id_type who, const asset_info& asset,
                                       const optional<share_type>& amount,
                                       const optional<account_id_type>& recipient )
{
   withdraw_operation op;
   op.account = who;
   op.asset = asset;
   op.amount = amount;
   op.recipient = recipient;
   return db.push_operation( op ).get<share_type>();
}

share_type database_fixture::borrow( account_id_type who, const asset_info& asset, share_type amount,
                                     const optional<account_id_type>& recipient )
{
   borrow_operation op;
   op.borrower = who;
   op.asset = asset;
   op.amount = amount;
   op.recipient = recipient;
   return db.push_operation( op ).get<share_type>();
}

share_type database_fixture::repay( account_id_type who, const asset_info& asset, share_type amount,
                                    const optional<account_id_type>& on_behalf_of )
{
   repay_operation op;
   op.account = who;
   op.asset = asset;
   op.amount = amount;
   op.on_behalf_of = on_behalf_of;
   return db.push_operation( op ).get<share_type>();
}

liquidation_result database_fixture::liquidate( account_id_type liquidator, const asset_info& collateral_asset,
                                                const asset_info& debt_asset, account_id_type user,
                                                share_type amount, bool receive_ma_token )
{
   liquidate_operation op;
   op.liquidator = liquidator;
   op.collateral_asset = collateral_asset;
   op.debt_asset = debt_asset;
   op.user = user;
   op.amount = amount;
   op.receive_ma_token = receive_ma_token;
   return db.push_operation( op ).get<liquidation_result>();
}

void database_fixture::set_uncollateralized_limit( account_id_type user, const asset_info& asset, share_type limit )
{
   update_uncollateralized_loan_limit_operation op;
   op.owner = owner_id;
   op.user = user;
   op.asset = asset;
   op.new_limit = limit;
   db.push_operation( op );
}

void database_fixture::set_collateral_status( account_id_type who, const asset_info& asset, bool enable )
{
   update_user_collateral_asset_status_operation op;
   op.account = who;
   op.asset = asset;
   op.enable = enable;
   db.push_operation( op );
}

void database_fixture::transfer_ma_token( account_id_type from, account_id_type to, const asset_info& asset,
                                          share_type amount )
{
   ma_token_transfer_operation op;
   op.from = from;
   op.to = to;
   op.asset = asset;
   op.amount = amount;
   db.push_operation( op );
}

share_type database_fixture::distribute_income( account_id_type sender, const asset_info& asset,
                                                const optional<share_type>& amount )
{
   distribute_protocol_income_operation op;
   op.sender_account = sender;
   op.asset = asset;
   op.amount = amount;
   return db.push_operation( op ).get<share_type>();
}

operation_result database_fixture::send_token( account_id_type who, const string& contract, share_type amount,
                                               const token_receive_payload& payload )
{
   token_receive_operation op;
   op.contract_addr = contract;
   op.sender_account = who;
   op.amount = amount;
   op.payload = payload;
   return db.push_operation( op );
}

share_type database_fixture::collateral_of( account_id_type who, const asset_info& asset )const
{
   const market_object& market = db.get_market( asset );
   const collateral_object* c = db.find_collateral( who, market.get_id() );
   if( c == nullptr )
      return 0;
   return get_underlying_liquidity_amount( c->amount_scaled, market.get_updated_liquidity_index( db.head_time() ) );
}

share_type database_fixture::debt_of( account_id_type who, const asset_info& asset )const
{
   const market_object& market = db.get_market( asset );
   const debt_object* d = db.find_debt( who, market.get_id() );
   if( d == nullptr )
      return 0;
   return get_underlying_debt_amount( d->amount_scaled, market.get_updated_borrow_index( db.head_time() ) );
}

void database_fixture::verify_market_totals()const
{
   std::map<market_id_type, scaled_amount_type> collateral_totals;
   std::map<market_id_type, scaled_amount_type> debt_totals;

   for( const collateral_object& c : db.get_index_type<collateral_index>().indices() )
   {
      BOOST_CHECK( c.amount_scaled > 0 );
      collateral_totals[c.market] += c.amount_scaled;
   }
   for( const debt_object& d : db.get_index_type<debt_index>().indices() )
   {
      BOOST_CHECK( d.amount_scaled > 0 );
      debt_totals[d.market] += d.amount_scaled;
   }

   for( const market_object& m : db.get_index_type<market_index>().indices() )
   {
      BOOST_CHECK( collateral_totals[m.get_id()] == m.collateral_total_scaled );
      BOOST_CHECK( debt_totals[m.get_id()] == m.debt_total_scaled );
      BOOST_CHECK( m.available_liquidity >= 0 );
      BOOST_CHECK( m.protocol_income_to_distribute >= 0 );
   }
}

} } // redbank::chain
