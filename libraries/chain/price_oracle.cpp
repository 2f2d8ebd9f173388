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
#include <redbank/chain/price_oracle.hpp>
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>
#include <redbank/chain/price_feed_object.hpp>

namespace redbank { namespace chain {

decimal database_price_oracle::get_price( const asset_info& asset )const
{
   const auto& idx = _db.get_index_type<price_feed_index>().indices().get<by_asset_ref>();
   auto itr = idx.find( asset_reference( asset ) );
   REDBANK_ASSERT( itr != idx.end(), price_not_available,
                   "No price for asset ${a}", ("a", asset_label( asset )) );
   return itr->price;
}

} } // redbank::chain
