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
#include <boost/test/unit_test.hpp>

#include <redbank/chain/market_object.hpp>
#include <redbank/chain/position_object.hpp>

#include "../common/database_fixture.hpp"

using namespace redbank::chain;

namespace {
   const asset_info uluna = native( "uluna" );
   const asset_info uusd  = native( "uusd" );
}

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( failed_operation_leaves_no_trace )
{ try {
   ACTORS( (alice) );
   init_market( uusd );
   fund( alice_id, uusd, 1000 );
   const uint64_t count = db.get_dynamic_global_properties().operation_count;

   deposit( alice_id, uusd, 600 );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().operation_count, count + 1 );

   // the second deposit fails after the market was accrued and the balance checked
   REDBANK_REQUIRE_THROW( deposit( alice_id, uusd, 600 ), fc::exception );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().operation_count, count + 1 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uusd ).value, 400 );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, uusd ).value, 600 );
   BOOST_CHECK_EQUAL( db.get_market( uusd ).available_liquidity.value, 600 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( clock_only_moves_forward )
{ try {
   const time_point_sec start = db.head_time();
   BOOST_CHECK( start == time_point_sec( REDBANK_TESTING_GENESIS_TIMESTAMP ) );

   db.advance_time( 60 );
   BOOST_CHECK( db.head_time() == start + 60 );
   db.set_time( start + 60 );
   REDBANK_REQUIRE_THROW( db.set_time( start ), fc::exception );
   BOOST_CHECK( db.head_time() == start + 60 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_is_applied_once )
{ try {
   REDBANK_REQUIRE_THROW( db.init_genesis( genesis_state ), fc::exception );

   genesis_state_type duplicated = make_genesis();
   duplicated.initial_accounts.push_back( { "treasury" } );
   REDBANK_REQUIRE_THROW( duplicated.validate(), fc::exception );

   genesis_state_type unknown_owner = make_genesis();
   unknown_owner.initial_config.owner_name = "nobody";
   REDBANK_REQUIRE_THROW( unknown_owner.validate(), fc::exception );

   genesis_state_type bad_name = make_genesis();
   bad_name.initial_accounts.push_back( { "Not Valid" } );
   REDBANK_REQUIRE_THROW( bad_name.validate(), invalid_parameter );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_with_markets )
{ try {
   genesis_state_type genesis = make_genesis();
   genesis.initial_accounts.push_back( { "alice" } );
   genesis.initial_balances.push_back( { "alice", uusd, 5000 } );
   genesis.initial_prices.push_back( { uusd, decimal::one() } );
   genesis.initial_markets.push_back( { uusd, default_asset_params(), optional<string>( "mausd" ) } );
   genesis.initial_markets.push_back( { uluna, default_asset_params(), optional<string>() } );

   database other;
   other.init_genesis( genesis );
   const account_id_type alice = other.get_account_by_name( "alice" ).get_id();
   BOOST_CHECK_EQUAL( other.get_balance( alice, uusd ).value, 5000 );
   BOOST_CHECK( other.get_price( uusd ) == decimal::one() );
   BOOST_CHECK_EQUAL( other.get_market( uusd ).ma_token_symbol, "mausd" );
   BOOST_CHECK_EQUAL( other.get_market( uusd ).index, 0u );
   BOOST_CHECK_EQUAL( other.get_market( uluna ).ma_token_symbol, "mauluna" );
   BOOST_CHECK_EQUAL( other.get_market( uluna ).index, 1u );
   BOOST_CHECK_EQUAL( other.get_global_properties().market_count, 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( account_names )
{ try {
   ACTORS( (alice) );
   BOOST_CHECK( get_account( "alice" ).get_id() == alice_id );
   REDBANK_REQUIRE_THROW( create_account( "alice" ), fc::exception );
   REDBANK_REQUIRE_THROW( create_account( "" ), invalid_parameter );
   REDBANK_REQUIRE_THROW( create_account( "Alice" ), invalid_parameter );
   REDBANK_REQUIRE_THROW( create_account( string( REDBANK_MAX_ACCOUNT_NAME_LENGTH + 1, 'a' ) ), invalid_parameter );
   create_account( "terra1.bob_2-x" );
   BOOST_CHECK( db.find_account_by_name( "nobody" ) == nullptr );
   REDBANK_REQUIRE_THROW( get_account( "nobody" ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( init_market_checks )
{ try {
   ACTORS( (alice) );

   init_asset_operation op;
   op.owner = alice_id;
   op.asset = uusd;
   op.params = default_asset_params();
   REDBANK_REQUIRE_THROW( db.push_operation( op ), unauthorized_exception );

   const market_object& market = init_market( uusd );
   BOOST_CHECK_EQUAL( market.ma_token_symbol, "mauusd" );
   BOOST_CHECK( market.borrow_index == decimal::one() );
   BOOST_CHECK( market.liquidity_index == decimal::one() );
   BOOST_CHECK( market.borrow_rate == decimal::percent( 5 ) );
   BOOST_CHECK( market.liquidity_rate == decimal::zero() );
   BOOST_CHECK( market.interests_last_updated == db.head_time() );
   BOOST_CHECK( db.find_market_by_ma_token( "mauusd" ) == &market );

   REDBANK_REQUIRE_THROW( init_market( uusd ), init_asset_already_initialized );
   REDBANK_REQUIRE_THROW( init_market( uluna, default_asset_params(), string( "mauusd" ) ), fc::exception );

   asset_params missing = default_asset_params();
   missing.liquidation_bonus.reset();
   REDBANK_REQUIRE_THROW( init_market( uluna, missing ), invalid_parameter );

   asset_params inverted = default_asset_params();
   inverted.maintenance_margin = decimal::percent( 50 );
   REQUIRE_EXCEPTION_WITH_TEXT( init_market( uluna, inverted ), "maintenance_margin should be greater" );

   asset_params above_one = default_asset_params();
   above_one.reserve_factor = decimal::percent( 101 );
   REDBANK_REQUIRE_THROW( init_market( uluna, above_one ), invalid_parameter );

   BOOST_CHECK( db.find_market( uluna ) == nullptr );
   REDBANK_REQUIRE_THROW( db.get_market( uluna ), asset_not_initialized );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_market_merges_params )
{ try {
   ACTORS( (alice)(bob) );
   init_market( uluna );
   init_market( uusd );
   set_price( uluna, "25" );
   set_price( uusd, "1" );
   fund( bob_id, uusd, 1000000 );
   deposit( bob_id, uusd, 1000000 );
   fund( alice_id, uluna, 100000 );
   deposit( alice_id, uluna, 100000 );
   borrow( alice_id, uusd, 500000 );

   asset_params update;
   update.max_loan_to_value = decimal::percent( 60 );
   update.reserve_factor = decimal::percent( 20 );
   update_market( uusd, update );

   const market_object& market = db.get_market( uusd );
   BOOST_CHECK( market.max_loan_to_value == decimal::percent( 60 ) );
   BOOST_CHECK( market.reserve_factor == decimal::percent( 20 ) );
   BOOST_CHECK( market.maintenance_margin == decimal::percent( 65 ) );
   BOOST_CHECK( market.liquidation_bonus == decimal::percent( 10 ) );
   // rates follow the new reserve factor: 0.04375 * 0.5 * 0.8
   BOOST_CHECK( market.liquidity_rate == decimal::from_string( "0.0175" ) );

   asset_params invalid;
   invalid.max_loan_to_value = decimal::percent( 70 );
   REDBANK_REQUIRE_THROW( update_market( uusd, invalid ), invalid_parameter );
   BOOST_CHECK( market.max_loan_to_value == decimal::percent( 60 ) );

   update_asset_operation op;
   op.owner = alice_id;
   op.asset = uusd;
   op.params = update;
   REDBANK_REQUIRE_THROW( db.push_operation( op ), unauthorized_exception );
   op.owner = owner_id;
   op.asset = native( "uatom" );
   REDBANK_REQUIRE_THROW( db.push_operation( op ), asset_not_initialized );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( asset_prices )
{ try {
   ACTORS( (alice) );
   REDBANK_REQUIRE_THROW( db.get_price( uluna ), price_not_available );

   set_price( uluna, "25.5" );
   BOOST_CHECK( db.get_price( uluna ) == decimal::from_string( "25.5" ) );
   set_price( uluna, "20" );
   BOOST_CHECK( db.get_price( uluna ) == decimal::from_string( "20" ) );

   REDBANK_REQUIRE_THROW( set_price( uluna, "0" ), invalid_parameter );

   set_asset_price_operation op;
   op.owner = alice_id;
   op.asset = uluna;
   op.price = decimal::one();
   REDBANK_REQUIRE_THROW( db.push_operation( op ), unauthorized_exception );
   BOOST_CHECK( db.get_price( uluna ) == decimal::from_string( "20" ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_configuration )
{ try {
   ACTORS( (alice) );

   config_params params;
   params.close_factor = decimal::percent( 40 );
   params.staking = alice_id;
   update_config( params );
   BOOST_CHECK( db.get_config().close_factor == decimal::percent( 40 ) );
   BOOST_CHECK( db.get_config().staking == alice_id );
   BOOST_CHECK( db.get_config().treasury == treasury_id );

   config_params too_much;
   too_much.insurance_fund_fee_share = decimal::percent( 50 );
   too_much.treasury_fee_share = decimal::percent( 60 );
   REQUIRE_EXCEPTION_WITH_TEXT( update_config( too_much ), "exceed one" );

   config_params unknown;
   unknown.treasury = account_id_type( 1000 );
   REDBANK_REQUIRE_THROW( update_config( unknown ), fc::exception );

   // ownership can be handed over
   config_params handover;
   handover.owner = alice_id;
   update_config( handover );
   REDBANK_REQUIRE_THROW( update_config( params ), unauthorized_exception );
   BOOST_CHECK( db.get_config().owner == alice_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
