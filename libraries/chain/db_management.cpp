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

database::database()
{
   initialize_indexes();
   initialize_evaluators();
   _price_oracle = std::make_unique<database_price_oracle>( *this );
}

database::~database() = default;

void database::set_price_oracle( std::unique_ptr<price_oracle> oracle )
{
   FC_ASSERT( oracle != nullptr, "Price oracle must not be null" );
   _price_oracle = std::move( oracle );
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( get_index_type<global_property_index>().size() == 0, "Genesis state has already been applied" );
   genesis_state.validate();

   _undo_db.disable();

   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.time = genesis_state.initial_timestamp;
   });

   for( const auto& account : genesis_state.initial_accounts )
   {
      create<account_object>( [&account]( account_object& a ) {
         a.name = account.name;
      });
   }

   const auto& init_config = genesis_state.initial_config;
   redbank_config config;
   config.owner                    = get_account_by_name( init_config.owner_name ).get_id();
   config.close_factor             = init_config.close_factor;
   config.insurance_fund_fee_share = init_config.insurance_fund_fee_share;
   config.treasury_fee_share       = init_config.treasury_fee_share;
   config.insurance_fund           = get_account_by_name( init_config.insurance_fund_name ).get_id();
   config.treasury                 = get_account_by_name( init_config.treasury_name ).get_id();
   config.staking                  = get_account_by_name( init_config.staking_name ).get_id();
   config.tax_rate                 = init_config.tax_rate;
   config.tax_caps                 = init_config.tax_caps;
   config.validate();

   create<global_property_object>( [&config]( global_property_object& p ) {
      p.config = config;
   });

   for( const auto& balance : genesis_state.initial_balances )
      adjust_balance( get_account_by_name( balance.owner_name ).get_id(), balance.asset, balance.amount );

   _undo_db.enable();

   for( const auto& p : genesis_state.initial_prices )
   {
      set_asset_price_operation op;
      op.owner = config.owner;
      op.asset = p.asset;
      op.price = p.price;
      push_operation( op );
   }

   for( const auto& m : genesis_state.initial_markets )
   {
      init_asset_operation op;
      op.owner  = config.owner;
      op.asset  = m.asset;
      op.params = m.params;
      op.symbol = m.symbol;
      push_operation( op );
   }

   ilog( "Initialized ledger with ${a} accounts and ${m} markets at ${t}",
         ("a", genesis_state.initial_accounts.size())("m", genesis_state.initial_markets.size())
         ("t", genesis_state.initial_timestamp) );
} FC_CAPTURE_AND_RETHROW() }

} }
