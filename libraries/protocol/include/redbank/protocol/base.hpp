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
#pragma once
#include <redbank/protocol/types.hpp>
#include <redbank/protocol/asset_info.hpp>

namespace redbank { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @ingroup protocol
    *
    *  Every change to the ledger is expressed as an operation.  An operation names the account
    *  on whose behalf it is executed (sender()), checks its own internal consistency in
    *  validate(), and is evaluated against the ledger state by the matching evaluator.
    *
    *  Operations that move native coins into the bank carry the coins in their amount field;
    *  the evaluator takes them from the sender's bank balance.
    */

   struct void_result{};

   struct base_operation
   {
      virtual ~base_operation() = default;
      virtual void validate()const {}
   };

} } // redbank::protocol

FC_REFLECT( redbank::protocol::void_result, )
