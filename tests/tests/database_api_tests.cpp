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

#include <redbank/app/database_api.hpp>

#include <fc/variant_object.hpp>

#include "../common/database_fixture.hpp"

using namespace redbank::chain;
using namespace redbank::app;

namespace {
   const asset_info uluna = native( "uluna" );
   const asset_info uusd  = native( "uusd" );
}

BOOST_FIXTURE_TEST_SUITE( database_api_tests, database_fixture )

BOOST_AUTO_TEST_CASE( list_markets_in_creation_order )
{ try {
   database_api db_api( db );
   BOOST_CHECK( db_api.list_markets( optional<uint32_t>(), 10 ).empty() );

   const string denoms[] = { "uatom", "uluna", "ukrw", "uusd", "umnt" };
   for( const string& denom : denoms )
      init_market( native( denom ) );

   const vector<market_api_object> all = db_api.list_markets( optional<uint32_t>(), 10 );
   BOOST_REQUIRE_EQUAL( all.size(), 5u );
   for( uint32_t i = 0; i < all.size(); ++i )
   {
      BOOST_CHECK_EQUAL( all[i].index, i );
      BOOST_CHECK( all[i].asset == native( denoms[i] ) );
      BOOST_CHECK_EQUAL( all[i].ma_token_symbol, "ma" + denoms[i] );
   }

   const vector<market_api_object> page = db_api.list_markets( optional<uint32_t>( 1 ), 2 );
   BOOST_REQUIRE_EQUAL( page.size(), 2u );
   BOOST_CHECK_EQUAL( page[0].index, 2u );
   BOOST_CHECK_EQUAL( page[1].index, 3u );

   BOOST_CHECK_EQUAL( db_api.list_markets( optional<uint32_t>( 3 ), 10 ).size(), 1u );
   BOOST_CHECK( db_api.list_markets( optional<uint32_t>( 4 ), 10 ).empty() );
   BOOST_CHECK( db_api.list_markets( optional<uint32_t>(), 0 ).empty() );
   REDBANK_REQUIRE_THROW( db_api.list_markets( optional<uint32_t>(), REDBANK_API_MAX_LIST_MARKETS_LIMIT + 1 ),
                          fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( market_and_user_queries )
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
   set_uncollateralized_limit( alice_id, uluna, 300 );

   database_api db_api( db );
   db.advance_time( REDBANK_SECONDS_PER_YEAR );

   // nothing was accrued on the ledger, the api projects the indices
   const market_api_object market = db_api.get_market( uusd );
   BOOST_CHECK( market.borrow_index == decimal::from_string( "1.04375" ) );
   BOOST_CHECK( market.liquidity_index == decimal::from_string( "1.0196875" ) );
   BOOST_CHECK_EQUAL( market.debt_total.value, 521875 );
   BOOST_CHECK_EQUAL( market.collateral_total.value, 1019687 );
   BOOST_CHECK_EQUAL( market.available_liquidity.value, 500000 );
   BOOST_CHECK( db.get_market( uusd ).borrow_index == decimal::one() );
   REDBANK_REQUIRE_THROW( db_api.get_market( native( "ukrw" ) ), asset_not_initialized );

   BOOST_CHECK_EQUAL( db_api.get_underlying_debt_amount( uusd, db_api.get_scaled_debt_amount( uusd, 1043750 ) ).value,
                      1043750 );
   BOOST_CHECK( db_api.get_scaled_liquidity_amount( uluna, 1000 ) == fc::uint128_t( 1000000000 ) );
   BOOST_CHECK_EQUAL( db_api.get_underlying_liquidity_amount( uluna, 1000000000 ).value, 1000 );

   const vector<user_collateral_api_object> collaterals = db_api.get_user_collaterals( "bob" );
   BOOST_REQUIRE_EQUAL( collaterals.size(), 1u );
   BOOST_CHECK( collaterals[0].asset == uusd );
   BOOST_CHECK_EQUAL( collaterals[0].ma_token_symbol, "mauusd" );
   BOOST_CHECK_EQUAL( collaterals[0].amount.value, 1019687 );
   BOOST_CHECK( collaterals[0].enabled );
   BOOST_CHECK( db_api.get_user_debts( "bob" ).empty() );

   const vector<user_debt_api_object> debts = db_api.get_user_debts( "alice" );
   BOOST_REQUIRE_EQUAL( debts.size(), 1u );
   BOOST_CHECK( debts[0].asset == uusd );
   BOOST_CHECK_EQUAL( debts[0].amount.value, 521875 );
   BOOST_CHECK( !debts[0].uncollateralized );

   // accounts are found by name or by id
   const string alice_id_string = std::string( object_id_type( alice_id ) );
   BOOST_CHECK_EQUAL( db_api.get_user_collaterals( alice_id_string ).size(), 1u );
   REDBANK_REQUIRE_THROW( db_api.get_user_debts( "nobody" ), fc::exception );

   BOOST_CHECK_EQUAL( db_api.get_uncollateralized_loan_limit( "alice", uluna ).value, 300 );
   BOOST_CHECK_EQUAL( db_api.get_uncollateralized_loan_limit( "alice", uusd ).value, 0 );
   const vector<uncollateralized_limit_api_object> limits = db_api.get_uncollateralized_loan_limits( "alice" );
   BOOST_REQUIRE_EQUAL( limits.size(), 1u );
   BOOST_CHECK( limits[0].asset == uluna );
   BOOST_CHECK_EQUAL( limits[0].limit.value, 300 );

   const user_position position = db_api.get_user_position( "alice" );
   BOOST_CHECK( position.health.is_borrowing() );
   BOOST_CHECK( position.total_collateral_value == fc::uint128_t( 2500000 ) );
   BOOST_CHECK( position.total_debt_value == fc::uint128_t( 521875 ) );
   BOOST_CHECK( position.max_debt_value == fc::uint128_t( 1375000 ) );

   BOOST_CHECK_EQUAL( db_api.get_account_balance( "alice", uusd ).value, 500000 );
   BOOST_CHECK_EQUAL( db_api.get_account_balance( "bob", uluna ).value, 0 );
   BOOST_CHECK( db_api.get_head_time() == db.head_time() );
   BOOST_CHECK( db_api.get_config().owner == owner_id );

   const fc::variants objects = db_api.get_objects( { market.id, object_id_type( market_id_type( 99 ) ) } );
   BOOST_REQUIRE_EQUAL( objects.size(), 2u );
   BOOST_CHECK_EQUAL( objects[0]["ma_token_symbol"].as_string(), "mauusd" );
   BOOST_CHECK( objects[1].is_null() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
