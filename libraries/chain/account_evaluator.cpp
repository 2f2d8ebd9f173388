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
#include <redbank/chain/account_evaluator.hpp>
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

void_result account_create_evaluator::do_evaluate( const account_create_operation& op )const
{ try {
   FC_ASSERT( db().find_account_by_name( op.name ) == nullptr, "Account name ${n} is already taken", ("n", op.name) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type account_create_evaluator::do_apply( const account_create_operation& op )const
{ try {
   const account_object& account = db().create<account_object>( [&op]( account_object& a ) {
      a.name = op.name;
   });
   ilog( "Created account ${n} as ${id}", ("n", op.name)("id", account.id) );
   return account.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
