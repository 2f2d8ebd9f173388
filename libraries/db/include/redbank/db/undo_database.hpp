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
#include <redbank/db/object.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace redbank { namespace db {

   using std::unordered_map;
   class object_database;

   /**
    *  Changes recorded since a session was opened, enough to put every touched index back the
    *  way it was.  Objects created during the session only have their id remembered.
    */
   struct undo_state
   {
      unordered_map<object_id_type, unique_ptr<object> > old_values;
      unordered_map<object_id_type, unique_ptr<object> > removed;
      std::unordered_set<object_id_type>                 new_ids;
      /// next id of each touched index when the session opened, keyed by space and type
      unordered_map<object_id_type, object_id_type>      old_next_ids;

      void record_create( const object& obj );
      void record_modify( const object& obj );
      void record_remove( const object& obj );

      /// Moves everything recorded here into @p outer, keeping whatever @p outer already saved
      void merge_into( undo_state& outer );
   };

   /**
    * @class undo_database
    * @brief journals changes to the object database so that an operation can be rolled back
    *
    * Each session owns one undo_state.  Sessions nest: committing or merging an inner session
    * hands its changes to the enclosing one, so that the outer undo still reverts them.  Once
    * the outermost session is committed its changes are final and the journal is dropped.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_open(mv._open)
               {
                  mv._open = false;
               }
               ~session()
               {
                  if( !_open )
                     return;
                  try {
                     _db.undo();
                  }
                  catch( const fc::exception& e )
                  {
                     // the ledger can not be trusted past this point
                     elog( "Failed to undo session: ${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }

               void commit() { if( _open ) _db.commit(); _open = false; }
               void undo()   { if( _open ) _db.undo();   _open = false; }
               void merge()  { if( _open ) _db.merge();  _open = false; }

               session& operator = ( session&& mv ) = delete;

            private:
               friend class undo_database;
               session( undo_database& db, bool open ):_db(db),_open(open) {}

               undo_database& _db;
               bool           _open;
         };

         void enable()  { _disabled = false; }
         void disable() { _disabled = true;  }
         bool enabled()const { return !_disabled; }

         /// A disabled journal hands out sessions that do nothing
         session start_undo_session();

         /// Called just after @p obj was created
         void on_create( const object& obj );
         /// Called just before @p obj is modified
         void on_modify( const object& obj );
         /// Called just before @p obj is removed
         void on_remove( const object& obj );

         uint32_t active_sessions()const { return static_cast<uint32_t>( _stack.size() ); }

      private:
         void undo();
         void merge();
         void commit();

         /// The state changes are recorded in, nullptr when nothing is being journaled
         undo_state* recording();

         bool                     _disabled = true;
         std::vector<undo_state>  _stack;
         object_database&         _db;
   };

} } // redbank::db
