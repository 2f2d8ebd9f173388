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
#include <redbank/protocol/token.hpp>
#include <redbank/protocol/exceptions.hpp>

namespace redbank { namespace protocol {

void token_receive_operation::validate()const
{
   validate_asset_info( token_asset_info() );
   REDBANK_ASSERT( amount > 0, invalid_parameter, "Amount must be greater than 0", ("amount", amount) );
   if( payload.is_type<liquidate_token_payload>() )
   {
      const auto& p = payload.get<liquidate_token_payload>();
      validate_asset_info( p.collateral_asset );
      REDBANK_ASSERT( p.user != sender_account, invalid_parameter, "Cannot liquidate own position", ("user", p.user) );
   }
}

} } // redbank::protocol
