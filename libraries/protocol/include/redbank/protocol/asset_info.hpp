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
#pragma once
#include <redbank/protocol/types.hpp>

namespace redbank { namespace protocol {

   /// A coin of the chain's bank module, identified by its denomination
   struct native_asset
   {
      string denom;
   };

   /// A fungible token implemented by a token contract, identified by the contract address
   struct token_asset
   {
      string contract_addr;
   };

   /**
    *  @brief Identifies an asset handled by the red bank.
    *
    *  Markets, balances, prices and limits are all keyed by the asset reference which
    *  is derived from this variant (tag first, then payload) so that equality and
    *  ordering are consistent with the tagged union.
    */
   using asset_info = static_variant< native_asset, token_asset >;

   /// Canonical map key: one byte holding the variant tag followed by the payload
   string asset_reference( const asset_info& a );

   /// Human readable label: the denom or the contract address
   string asset_label( const asset_info& a );

   bool is_native( const asset_info& a );

   /// The denom of a native asset; throws for token assets
   const string& native_denom( const asset_info& a );

   void validate_asset_info( const asset_info& a );

   inline asset_info native( const string& denom ) { return native_asset{ denom }; }
   inline asset_info token( const string& contract_addr ) { return token_asset{ contract_addr }; }

   inline bool operator == ( const asset_info& a, const asset_info& b )
   { return asset_reference( a ) == asset_reference( b ); }
   inline bool operator != ( const asset_info& a, const asset_info& b )
   { return !( a == b ); }
   inline bool operator < ( const asset_info& a, const asset_info& b )
   { return asset_reference( a ) < asset_reference( b ); }

} } // redbank::protocol

FC_REFLECT( redbank::protocol::native_asset, (denom) )
FC_REFLECT( redbank::protocol::token_asset, (contract_addr) )
