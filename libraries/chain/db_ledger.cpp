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
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

operation_result database::push_operation( const operation& op )
{ try {
   FC_ASSERT( _undo_db.active_sessions() == 0, "Operations can not be pushed while another one is being applied" );

   auto session = _undo_db.start_undo_session();
   operation_validate( op );

   evaluation_state eval_state( this );
   operation_result result = apply_operation( eval_state, op );

   modify( get_dynamic_global_properties(), []( dynamic_global_property_object& dgp ) {
      ++dgp.operation_count;
   });

   session.commit();
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result database::apply_nested_operation( const evaluation_state& parent, const operation& op,
                                                   const optional<share_type>& prepaid_amount )
{ try {
   REDBANK_ASSERT( parent.nesting_depth < REDBANK_MAX_NESTED_OPERATION_DEPTH, nested_operation_depth_exceeded,
                   "Nested operations may only be ${d} level deep", ("d", REDBANK_MAX_NESTED_OPERATION_DEPTH) );
   operation_validate( op );

   auto session = _undo_db.start_undo_session();
   evaluation_state eval_state( this, parent.nesting_depth + 1 );
   eval_state.prepaid_amount = prepaid_amount;
   operation_result result = apply_operation( eval_state, op );
   session.merge();
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result database::apply_operation( evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   FC_ASSERT( i_which >= 0, "Negative operation tag" );
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for this operation" );
   const unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );
   return eval->evaluate( eval_state, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::set_time( time_point_sec t )
{
   const time_point_sec now = head_time();
   FC_ASSERT( t >= now, "Time can not go backwards: head time is ${h}, new time ${t}", ("h", now)("t", t) );
   modify( get_dynamic_global_properties(), [t]( dynamic_global_property_object& dgp ) {
      dgp.time = t;
   });
}

void database::advance_time( uint32_t seconds )
{
   set_time( head_time() + seconds );
}

} }
