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
#include <redbank/db/object_database.hpp>
#include <redbank/db/undo_database.hpp>

namespace redbank { namespace db {

void undo_state::record_create( const object& obj )
{
   const object_id_type index_id( obj.id.space(), obj.id.type(), 0 );
   // the first id handed out is the one to roll back to
   old_next_ids.emplace( index_id, obj.id );
   new_ids.insert( obj.id );
}

void undo_state::record_modify( const object& obj )
{
   if( new_ids.count( obj.id ) || old_values.count( obj.id ) )
      return;
   old_values.emplace( obj.id, obj.clone() );
}

void undo_state::record_remove( const object& obj )
{
   if( new_ids.erase( obj.id ) )
      return;

   auto modified = old_values.find( obj.id );
   if( modified != old_values.end() )
   {
      removed[obj.id] = std::move( modified->second );
      old_values.erase( modified );
      return;
   }
   if( !removed.count( obj.id ) )
      removed.emplace( obj.id, obj.clone() );
}

void undo_state::merge_into( undo_state& outer )
{
   for( auto& item : old_values )
   {
      if( outer.new_ids.count( item.first ) )
         continue;
      outer.old_values.emplace( item.first, std::move( item.second ) );
   }

   for( const auto& id : new_ids )
      outer.new_ids.insert( id );

   for( const auto& item : old_next_ids )
      outer.old_next_ids.emplace( item.first, item.second );

   for( auto& item : removed )
   {
      if( outer.new_ids.erase( item.first ) )
         continue;
      auto modified = outer.old_values.find( item.first );
      if( modified != outer.old_values.end() )
      {
         outer.removed[item.first] = std::move( modified->second );
         outer.old_values.erase( modified );
      }
      else
         outer.removed.emplace( item.first, std::move( item.second ) );
   }
}

undo_database::session undo_database::start_undo_session()
{
   if( _disabled )
      return session( *this, false );
   _stack.emplace_back();
   return session( *this, true );
}

undo_state* undo_database::recording()
{
   if( _disabled || _stack.empty() )
      return nullptr;
   return &_stack.back();
}

void undo_database::on_create( const object& obj )
{
   if( undo_state* state = recording() )
      state->record_create( obj );
}

void undo_database::on_modify( const object& obj )
{
   if( undo_state* state = recording() )
      state->record_modify( obj );
}

void undo_database::on_remove( const object& obj )
{
   if( undo_state* state = recording() )
      state->record_remove( obj );
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled, "Can not undo while the journal is disabled" );
   FC_ASSERT( !_stack.empty(), "No session to undo" );

   undo_state& state = _stack.back();
   disable();

   for( auto& item : state.old_values )
      _db.modify( _db.get_object( item.first ), [&item]( object& obj ){ obj.move_from( *item.second ); } );

   for( const auto& id : state.new_ids )
      _db.remove( _db.get_object( id ) );

   for( const auto& item : state.old_next_ids )
      _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );

   for( auto& item : state.removed )
      _db.insert( std::move( *item.second ) );

   _stack.pop_back();
   enable();
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( _stack.size() > 1, "Merging requires an enclosing session" );
   undo_state inner = std::move( _stack.back() );
   _stack.pop_back();
   inner.merge_into( _stack.back() );
}

void undo_database::commit()
{
   FC_ASSERT( !_stack.empty(), "No session to commit" );
   if( _stack.size() > 1 )
      merge();
   else
      _stack.pop_back();
}

} } // redbank::db
