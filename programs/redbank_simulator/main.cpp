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
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/stacktrace.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

using namespace redbank::chain;

namespace redbank { namespace simulator {

   /**
    *  One step of a scenario.  Exactly one of op, advance_seconds or report_position is set.
    *  When expect_failure is true the step passes only if the operation is rejected.
    */
   struct scenario_step
   {
      optional<operation> op;
      optional<uint32_t>  advance_seconds;
      optional<string>    report_position;
      bool                expect_failure = false;
   };

   struct scenario
   {
      vector<scenario_step> steps;
   };

   genesis_state_type make_example_genesis()
   {
      genesis_state_type genesis;
      for( const char* name : { "owner", "insurance-fund", "treasury", "staking", "alice", "bob", "liquidator" } )
         genesis.initial_accounts.push_back( { name } );

      auto& config = genesis.initial_config;
      config.owner_name = "owner";
      config.close_factor = decimal::percent( 50 );
      config.insurance_fund_fee_share = decimal::percent( 10 );
      config.treasury_fee_share = decimal::percent( 20 );
      config.insurance_fund_name = "insurance-fund";
      config.treasury_name = "treasury";
      config.staking_name = "staking";
      config.tax_rate = decimal::zero();

      linear_interest_rate_model model;
      model.optimal_utilization_rate = decimal::percent( 80 );
      model.base = decimal::zero();
      model.slope_1 = decimal::percent( 7 );
      model.slope_2 = decimal::percent( 45 );

      for( const char* denom : { "uluna", "uusd" } )
      {
         genesis_state_type::initial_market_type market;
         market.asset = native( denom );
         market.params.initial_borrow_rate = decimal::percent( 5 );
         market.params.max_loan_to_value = decimal::percent( 55 );
         market.params.reserve_factor = decimal::percent( 10 );
         market.params.maintenance_margin = decimal::percent( 65 );
         market.params.liquidation_bonus = decimal::percent( 10 );
         market.params.interest_rate_strategy = model;
         genesis.initial_markets.push_back( market );

         for( const char* owner : { "alice", "bob", "liquidator" } )
            genesis.initial_balances.push_back( { owner, native( denom ), 1000000000 } );
      }
      genesis.initial_prices.push_back( { native( "uluna" ), decimal::from_string( "25" ) } );
      genesis.initial_prices.push_back( { native( "uusd" ), decimal::one() } );
      return genesis;
   }

} } // redbank::simulator

FC_REFLECT( redbank::simulator::scenario_step, (op)(advance_seconds)(report_position)(expect_failure) )
FC_REFLECT( redbank::simulator::scenario, (steps) )

/// Hack to log messages to console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

void configure_console_logging( const std::string& level )
{
   fc::logging_config config = fc::logging_config::default_config();
   for( auto& logger : config.loggers )
      logger.level = fc::variant( level ).as<fc::log_level>( 1 );
   fc::configure_logging( config );
}

/// Runs every step of @p s; returns the number of steps that did not behave as expected
uint32_t run_scenario( database& db, const redbank::simulator::scenario& s )
{
   redbank::app::database_api api( db );
   uint32_t failures = 0;
   uint32_t step_num = 0;
   for( const auto& step : s.steps )
   {
      ++step_num;
      if( step.advance_seconds.valid() )
      {
         db.advance_time( *step.advance_seconds );
         ilog( "Step ${n}: time is now ${t}", ("n", step_num)("t", db.head_time()) );
      }
      if( step.report_position.valid() )
      {
         const auto position = api.get_user_position( *step.report_position );
         std::cout << fc::json::to_pretty_string( fc::variant( position, REDBANK_MAX_NESTED_OBJECTS ) ) << "\n";
      }
      if( !step.op.valid() )
         continue;

      try
      {
         const operation_result result = db.push_operation( *step.op );
         std::cout << fc::json::to_string( fc::variant( result, REDBANK_MAX_NESTED_OBJECTS ) ) << "\n";
         if( step.expect_failure )
         {
            elog( "Step ${n} was expected to fail but succeeded", ("n", step_num) );
            ++failures;
         }
      }
      catch( const fc::exception& e )
      {
         if( step.expect_failure )
            ilog( "Step ${n} failed as expected: ${e}", ("n", step_num)("e", e.to_string()) );
         else
         {
            elog( "Step ${n} failed:\n${e}", ("n", step_num)("e", e.to_detail_string()) );
            ++failures;
         }
      }
   }
   return failures;
}

int main( int argc, char** argv )
{
   fc::print_stacktrace_on_segfault();
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("Red Bank Simulator");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json", bpo::value<boost::filesystem::path>(), "File to read the genesis state from")
            ("create-genesis-json", bpo::value<boost::filesystem::path>(),
                    "Path to create an example genesis state at, then exit")
            ("scenario", bpo::value<boost::filesystem::path>(), "Scenario file to replay against the ledger")
            ("log-level", bpo::value<std::string>()->default_value("info"),
                    "Console log level: debug, info, warn or error");

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
      }
      catch (const boost::program_options::error& e)
      {
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }
      bpo::notify( options );

      configure_console_logging( options.at("log-level").as<std::string>() );

      if( options.count("create-genesis-json") > 0 )
      {
         const auto path = options.at("create-genesis-json").as<boost::filesystem::path>();
         fc::json::save_to_file( redbank::simulator::make_example_genesis(), path.string() );
         ilog( "Wrote example genesis state to ${p}", ("p", path.string()) );
         return EXIT_SUCCESS;
      }

      genesis_state_type genesis;
      if( options.count("genesis-json") > 0 )
      {
         const auto path = options.at("genesis-json").as<boost::filesystem::path>();
         genesis = fc::json::from_file( path.string() ).as<genesis_state_type>( REDBANK_MAX_NESTED_OBJECTS );
      }
      else
      {
         wlog( "No genesis state given, using the example genesis" );
         genesis = redbank::simulator::make_example_genesis();
      }

      database db;
      db.init_genesis( genesis );
      ilog( "Ledger initialized at ${t} with ${m} markets",
            ("t", db.head_time())("m", db.get_global_properties().market_count) );

      if( options.count("scenario") == 0 )
         return EXIT_SUCCESS;

      const auto scenario_path = options.at("scenario").as<boost::filesystem::path>();
      const auto s = fc::json::from_file( scenario_path.string() )
                        .as<redbank::simulator::scenario>( REDBANK_MAX_NESTED_OBJECTS );
      const uint32_t failures = run_scenario( db, s );
      ilog( "Replayed ${n} steps, ${f} unexpected results", ("n", s.steps.size())("f", failures) );
      return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if (unhandled_exception)
   {
      elog("Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()));
   }
   return EXIT_FAILURE;
}
