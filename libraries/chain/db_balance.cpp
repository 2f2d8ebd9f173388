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

share_type database::get_balance( account_id_type owner, const asset_info& asset )const
{
   const auto& idx = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = idx.find( boost::make_tuple( owner, asset_reference( asset ) ) );
   if( itr == idx.end() )
      return 0;
   return itr->balance;
}

void database::adjust_balance( account_id_type owner, const asset_info& asset, share_type delta )
{ try {
   if( delta == 0 )
      return;

   const auto& idx = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   const string ref = asset_reference( asset );
   auto itr = idx.find( boost::make_tuple( owner, ref ) );
   if( itr == idx.end() )
   {
      REDBANK_ASSERT( delta > 0, insufficient_balance,
                      "Insufficient balance: ${a}'s balance of 0 ${s} is less than required ${r}",
                      ("a", owner)("s", asset_label( asset ))("r", -delta) );
      create<account_balance_object>( [&]( account_balance_object& b ) {
         b.owner = owner;
         b.asset = asset;
         b.asset_ref = ref;
         b.balance = delta;
      });
   }
   else
   {
      if( delta < 0 )
         REDBANK_ASSERT( itr->balance >= -delta, insufficient_balance,
                         "Insufficient balance: ${a}'s balance of ${b} ${s} is less than required ${r}",
                         ("a", owner)("b", itr->balance)("s", asset_label( asset ))("r", -delta) );
      modify( *itr, [delta]( account_balance_object& b ) {
         b.adjust_balance( delta );
      });
   }
} FC_CAPTURE_AND_RETHROW( (owner)(asset)(delta) ) }

share_type database::compute_tax( const asset_info& asset, const share_type& amount )const
{
   if( !is_native( asset ) || amount <= 0 )
      return 0;

   const redbank_config& config = get_config();
   auto cap = config.tax_caps.find( native_denom( asset ) );
   if( cap == config.tax_caps.end() || config.tax_rate.is_zero() )
      return 0;

   const fc::uint128_t gross = static_cast<uint64_t>( amount.value );
   const fc::uint128_t net = ( decimal::one() + config.tax_rate ).div_floor( gross );
   const share_type tax = static_cast<int64_t>( gross - net );
   return std::min( tax, cap->second );
}

share_type database::pay_out( account_id_type recipient, const asset_info& asset, const share_type& amount )
{ try {
   FC_ASSERT( amount >= 0, "Cannot pay out a negative amount", ("amount", amount) );
   if( amount == 0 )
      return 0;

   const share_type tax = compute_tax( asset, amount );
   const share_type net = amount - tax;
   adjust_balance( recipient, asset, net );
   if( tax > 0 )
      dlog( "Withheld transfer tax of ${t} ${a} from payout to ${r}", ("t", tax)("a", asset_label( asset ))("r", recipient) );
   return net;
} FC_CAPTURE_AND_RETHROW( (recipient)(asset)(amount) ) }

} }
