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
#include <redbank/protocol/asset_info.hpp>
#include <redbank/protocol/exceptions.hpp>

namespace redbank { namespace protocol {

namespace {

   struct asset_payload_visitor
   {
      using result_type = string;

      string operator()( const native_asset& a )const { return a.denom; }
      string operator()( const token_asset& a )const  { return a.contract_addr; }
   };

}

string asset_reference( const asset_info& a )
{
   string result( 1, static_cast<char>( a.which() ) );
   result += a.visit( asset_payload_visitor() );
   return result;
}

string asset_label( const asset_info& a )
{
   return a.visit( asset_payload_visitor() );
}

bool is_native( const asset_info& a )
{
   return a.is_type<native_asset>();
}

const string& native_denom( const asset_info& a )
{
   FC_ASSERT( a.is_type<native_asset>(), "Asset ${a} is not a native asset", ("a", asset_label(a)) );
   return a.get<native_asset>().denom;
}

void validate_asset_info( const asset_info& a )
{
   const string payload = a.visit( asset_payload_visitor() );
   REDBANK_ASSERT( !payload.empty(), invalid_parameter, "Asset identifier must not be empty", ("asset", a) );
   REDBANK_ASSERT( payload.size() <= REDBANK_MAX_DENOM_LENGTH, invalid_parameter,
                   "Asset identifier is too long, max length is ${m}", ("m", REDBANK_MAX_DENOM_LENGTH)("asset", a) );
}

} } // redbank::protocol
