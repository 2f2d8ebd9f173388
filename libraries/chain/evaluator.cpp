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
#include <redbank/chain/evaluator.hpp>
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

database& generic_evaluator::db()const { return trx_state->db(); }

operation_result generic_evaluator::start_evaluate( evaluation_state& eval_state, const operation& op, bool apply )
{ try {
   trx_state = &eval_state;
   auto result = evaluate( op );

   if( apply ) result = this->apply( op );
   return result;
} FC_CAPTURE_AND_RETHROW() }

void generic_evaluator::verify_owner( account_id_type account )const
{
   const account_id_type owner = db().get_config().owner;
   REDBANK_ASSERT( account == owner, unauthorized_exception,
                   "Only the owner ${o} may do this, not ${a}", ("o", owner)("a", account) );
}

void generic_evaluator::verify_account_exists( account_id_type account )const
{
   FC_ASSERT( db().find( account ) != nullptr, "Account ${a} does not exist", ("a", account) );
}

void generic_evaluator::collect_funds( account_id_type from, const asset_info& asset, const share_type& amount )const
{
   if( trx_state->prepaid_amount.valid() )
   {
      FC_ASSERT( *trx_state->prepaid_amount == amount, "Prepaid amount ${p} does not match ${a}",
                 ("p", *trx_state->prepaid_amount)("a", amount) );
      return;
   }
   REDBANK_ASSERT( is_native( asset ), invalid_parameter,
                   "Token ${t} must be sent through its token contract", ("t", asset_label( asset )) );
   db().adjust_balance( from, asset, -amount );
}

} }
