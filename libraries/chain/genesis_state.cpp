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
#include <redbank/chain/genesis_state.hpp>
#include <redbank/protocol/exceptions.hpp>

#include <set>

namespace redbank { namespace chain {

void genesis_state_type::validate()const
{ try {
   std::set<string> names;
   for( const auto& a : initial_accounts )
   {
      REDBANK_ASSERT( is_valid_account_name( a.name ), invalid_parameter, "Invalid account name ${n}", ("n", a.name) );
      FC_ASSERT( names.insert( a.name ).second, "Duplicate initial account ${n}", ("n", a.name) );
   }

   auto require_account = [&names]( const string& name ) {
      FC_ASSERT( names.count( name ) > 0, "Unknown initial account ${n}", ("n", name) );
   };
   require_account( initial_config.owner_name );
   require_account( initial_config.insurance_fund_name );
   require_account( initial_config.treasury_name );
   require_account( initial_config.staking_name );

   for( const auto& b : initial_balances )
   {
      require_account( b.owner_name );
      validate_asset_info( b.asset );
      FC_ASSERT( b.amount >= 0, "Negative initial balance", ("balance", b) );
   }
   for( const auto& p : initial_prices )
      validate_asset_info( p.asset );
} FC_CAPTURE_AND_RETHROW() }

} } // redbank::chain
