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

BOOST_FIXTURE_TEST_SUITE( ledger_tests, database_fixture )

BOOST_AUTO_TEST_CASE( deposit_and_withdraw )
{ try {
   ACTORS( (alice)(bob) );
   init_market( uluna );
   set_price( uluna, "25" );
   fund( alice_id, uluna, 1000000 );

   deposit( alice_id, uluna, 400000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uluna ).value, 600000 );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, uluna ).value, 400000 );
   {
      const market_object& market = db.get_market( uluna );
      BOOST_CHECK_EQUAL( market.available_liquidity.value, 400000 );
      BOOST_CHECK( market.collateral_total_scaled == fc::uint128_t( 400000 ) * REDBANK_MA_TOKEN_SCALING_FACTOR );
      BOOST_CHECK( db.find_collateral( alice_id, market.get_id() )->enabled );
   }

   // on behalf of another account
   deposit( alice_id, uluna, 1000, bob_id );
   BOOST_CHECK_EQUAL( collateral_of( bob_id, uluna ).value, 1000 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, uluna ).value, 0 );

   BOOST_CHECK_EQUAL( withdraw( alice_id, uluna, share_type( 100000 ) ).value, 100000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uluna ).value, 699000 );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, uluna ).value, 300000 );

   // to a recipient
   BOOST_CHECK_EQUAL( withdraw( alice_id, uluna, share_type( 50000 ), bob_id ).value, 50000 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, uluna ).value, 50000 );

   REDBANK_REQUIRE_THROW( withdraw( alice_id, uluna, share_type( 250001 ) ), insufficient_balance );

   // no amount withdraws everything and removes the position
   BOOST_CHECK_EQUAL( withdraw( alice_id, uluna ).value, 250000 );
   BOOST_CHECK( db.find_collateral( alice_id, db.get_market( uluna ).get_id() ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uluna ).value, 949000 );

   REDBANK_REQUIRE_THROW( withdraw( alice_id, uluna ), insufficient_balance );
   BOOST_CHECK_EQUAL( db.get_market( uluna ).available_liquidity.value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( deposit_failures_leave_no_trace )
{ try {
   ACTORS( (alice) );
   init_market( uluna );
   fund( alice_id, uluna, 1000 );
   fund( alice_id, uusd, 1000 );

   const uint64_t operation_count = db.get_dynamic_global_properties().operation_count;

   REQUIRE_EXCEPTION_WITH_TEXT( deposit( alice_id, uusd, 100 ), "Asset not initialized" );
   REDBANK_REQUIRE_THROW( deposit( alice_id, uusd, 100 ), asset_not_initialized );
   REDBANK_REQUIRE_THROW( deposit( alice_id, uluna, 1001 ), insufficient_balance );
   REDBANK_REQUIRE_THROW( deposit( alice_id, uluna, 0 ), invalid_parameter );

   BOOST_CHECK_EQUAL( get_balance( alice_id, uluna ).value, 1000 );
   BOOST_CHECK_EQUAL( db.get_market( uluna ).available_liquidity.value, 0 );
   BOOST_CHECK( db.find_collateral( alice_id, db.get_market( uluna ).get_id() ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().operation_count, operation_count );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( borrow_against_collateral )
{ try {
   ACTORS( (alice)(bob)(carol) );
   init_market( uluna );
   init_market( uusd );
   set_price( uluna, "25" );
   set_price( uusd, "1" );

   fund( bob_id, uusd, 10000000 );
   deposit( bob_id, uusd, 10000000 );
   fund( alice_id, uluna, 100000 );
   deposit( alice_id, uluna, 100000 );

   // no collateral at all
   REQUIRE_EXCEPTION_WITH_TEXT( borrow( carol_id, uusd, 1 ),
                                "Borrow amount exceeds maximum allowed given current collateral value" );

   // 100000 uluna at 25 with a max LTV of 0.55
   BOOST_CHECK_EQUAL( borrow( alice_id, uusd, 1000000 ).value, 1000000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uusd ).value, 1000000 );
   BOOST_CHECK_EQUAL( debt_of( alice_id, uusd ).value, 1000000 );

   REDBANK_REQUIRE_THROW( borrow( alice_id, uusd, 375001 ), borrow_limit_exceeded );
   BOOST_CHECK_EQUAL( borrow( alice_id, uusd, 375000, bob_id ).value, 375000 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, uusd ).value, 375000 );
   BOOST_CHECK_EQUAL( debt_of( alice_id, uusd ).value, 1375000 );

   const market_object& usd_market = db.get_market( uusd );
   BOOST_CHECK_EQUAL( usd_market.available_liquidity.value, 10000000 - 1375000 );
   BOOST_CHECK( usd_market.borrow_rate > decimal::zero() );
   BOOST_CHECK( usd_market.liquidity_rate > decimal::zero() );
   BOOST_CHECK( usd_market.liquidity_rate < usd_market.borrow_rate );

   const user_position position = db.get_user_position( alice_id );
   BOOST_CHECK( position.total_collateral_value == 2500000 );
   BOOST_CHECK( position.max_debt_value == 1375000 );
   BOOST_CHECK( position.weighted_maintenance_margin_value == 1625000 );
   BOOST_CHECK( position.total_debt_value == 1375000 );
   BOOST_CHECK( position.health.is_borrowing() );
   BOOST_CHECK( position.health.health_factor == decimal::from_ratio( 1625000, 1375000 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( borrow_limited_by_liquidity )
{ try {
   ACTORS( (alice)(bob) );
   init_market( uluna );
   init_market( uusd );
   set_price( uluna, "25" );
   set_price( uusd, "1" );

   fund( bob_id, uusd, 1000 );
   deposit( bob_id, uusd, 1000 );
   fund( alice_id, uluna, 100000 );
   deposit( alice_id, uluna, 100000 );

   REDBANK_REQUIRE_THROW( borrow( alice_id, uusd, 1001 ), insufficient_liquidity );
   borrow( alice_id, uusd, 1000 );
   BOOST_CHECK_EQUAL( db.get_market( uusd ).available_liquidity.value, 0 );

   // the lender can not withdraw what is lent out
   REDBANK_REQUIRE_THROW( withdraw( bob_id, uusd ), insufficient_liquidity );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( health_checks_on_withdraw_and_collateral_status )
{ try {
   ACTORS( (alice)(bob) );
   init_market( uluna );
   init_market( uusd );
   set_price( uluna, "25" );
   set_price( uusd, "1" );

   fund( bob_id, uusd, 10000000 );
   deposit( bob_id, uusd, 10000000 );
   fund( alice_id, uluna, 100000 );
   deposit( alice_id, uluna, 100000 );

   // disabled collateral does not count
   set_collateral_status( alice_id, uluna, false );
   REDBANK_REQUIRE_THROW( borrow( alice_id, uusd, 1 ), borrow_limit_exceeded );
   set_collateral_status( alice_id, uluna, true );

   borrow( alice_id, uusd, 1375000 );

   REDBANK_REQUIRE_THROW( set_collateral_status( alice_id, uluna, false ), health_check_failed );
   BOOST_CHECK( db.find_collateral( alice_id, db.get_market( uluna ).get_id() )->enabled );

   // 80000 uluna weighted by 0.65 is worth less than the debt
   REDBANK_REQUIRE_THROW( withdraw( alice_id, uluna, share_type( 20000 ) ), health_check_failed );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, uluna ).value, 100000 );

   // the health factor stays above one, even though the LTV is exceeded
   withdraw( alice_id, uluna, share_type( 10000 ) );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, uluna ).value, 90000 );
   REDBANK_REQUIRE_THROW( borrow( alice_id, uusd, 1 ), borrow_limit_exceeded );

   // no position to enable
   REDBANK_REQUIRE_THROW( set_collateral_status( bob_id, uluna, true ), insufficient_balance );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( repay_debt )
{ try {
   ACTORS( (alice)(bob)(carol) );
   init_market( uluna );
   init_market( uusd );
   set_price( uluna, "25" );
   set_price( uusd, "1" );

   fund( bob_id, uusd, 10000000 );
   deposit( bob_id, uusd, 10000000 );
   fund( alice_id, uluna, 100000 );
   deposit( alice_id, uluna, 100000 );
   borrow( alice_id, uusd, 1000000 );

   REQUIRE_EXCEPTION_WITH_TEXT( repay( carol_id, uusd, 100 ), "Cannot repay 0 debt" );

   BOOST_CHECK_EQUAL( repay( alice_id, uusd, 400000 ).value, 0 );
   BOOST_CHECK_EQUAL( debt_of( alice_id, uusd ).value, 600000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uusd ).value, 600000 );

   // carol repays part of alice's debt
   fund( carol_id, uusd, 100000 );
   repay( carol_id, uusd, 100000, alice_id );
   BOOST_CHECK_EQUAL( debt_of( alice_id, uusd ).value, 500000 );

   // over-payment is refunded
   fund( alice_id, uusd, 100000 );
   BOOST_CHECK_EQUAL( repay( alice_id, uusd, 700000 ).value, 200000 );
   BOOST_CHECK( db.find_debt( alice_id, db.get_market( uusd ).get_id() ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uusd ).value, 200000 );
   BOOST_CHECK_EQUAL( db.get_market( uusd ).available_liquidity.value, 10000000 );

   const user_position position = db.get_user_position( alice_id );
   BOOST_CHECK( !position.health.is_borrowing() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( interest_accrual )
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

   // utilization 0.5: 0.07 * 0.5 / 0.8 and 0.04375 * 0.5 * ( 1 - 0.1 )
   const market_object& market = db.get_market( uusd );
   BOOST_CHECK( market.borrow_rate == decimal::from_string( "0.04375" ) );
   BOOST_CHECK( market.liquidity_rate == decimal::from_string( "0.0196875" ) );

   db.advance_time( REDBANK_SECONDS_PER_YEAR );

   // queries project the indices without touching the ledger
   BOOST_CHECK_EQUAL( debt_of( alice_id, uusd ).value, 521875 );
   BOOST_CHECK_EQUAL( collateral_of( bob_id, uusd ).value, 1019687 );
   BOOST_CHECK( market.borrow_index == decimal::one() );

   // any operation on the market accrues
   fund( bob_id, uusd, 1 );
   deposit( bob_id, uusd, 1 );
   BOOST_CHECK( market.borrow_index == decimal::from_string( "1.04375" ) );
   BOOST_CHECK( market.liquidity_index == decimal::from_string( "1.0196875" ) );
   BOOST_CHECK( market.interests_last_updated == db.head_time() );
   // reserve factor share of the 21875 accrued
   BOOST_CHECK_EQUAL( market.protocol_income_to_distribute.value, 2187 );

   fund( alice_id, uusd, 21875 );
   BOOST_CHECK_EQUAL( repay( alice_id, uusd, 521875 ).value, 0 );
   BOOST_CHECK( db.find_debt( alice_id, market.get_id() ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( ma_token_transfer )
{ try {
   ACTORS( (alice)(bob) );
   init_market( uluna );
   init_market( uusd );
   set_price( uluna, "25" );
   set_price( uusd, "1" );

   fund( bob_id, uusd, 10000000 );
   deposit( bob_id, uusd, 10000000 );
   fund( alice_id, uluna, 100000 );
   deposit( alice_id, uluna, 100000 );

   transfer_ma_token( alice_id, bob_id, uluna, 20000 );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, uluna ).value, 80000 );
   BOOST_CHECK_EQUAL( collateral_of( bob_id, uluna ).value, 20000 );

   REDBANK_REQUIRE_THROW( transfer_ma_token( alice_id, bob_id, uluna, 80001 ), insufficient_balance );
   REDBANK_REQUIRE_THROW( transfer_ma_token( alice_id, alice_id, uluna, 1 ), invalid_parameter );

   borrow( alice_id, uusd, 1100000 );
   // 60000 uluna weighted by 0.65 no longer covers the debt
   REDBANK_REQUIRE_THROW( transfer_ma_token( alice_id, bob_id, uluna, 20000 ), health_check_failed );
   transfer_ma_token( alice_id, bob_id, uluna, 10000 );
   BOOST_CHECK_EQUAL( collateral_of( bob_id, uluna ).value, 30000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
