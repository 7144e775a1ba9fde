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
#include <dollarstore/db/object.hpp>
#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <set>
#include <vector>

namespace dollarstore { namespace db {

   class object_database;

   /**
    *  One reversible change. Creations remember the id they consumed, modifications and removals
    *  remember the object as it was before the change.
    */
   struct undo_entry
   {
      enum action_type { created, modified, removed };

      action_type                action;
      object_id_type             id;
      std::unique_ptr<object>    prior;
   };

   /// The changes made while one session was innermost, in the order they happened
   struct undo_frame
   {
      std::vector<undo_entry>    journal;
      /// objects whose state on entry to the frame is already recoverable
      std::set<object_id_type>   covered;
   };

   /**
    *  @class undo_database
    *  @brief journals changes to the object_database so that open sessions can be rolled back
    *
    *  Each session owns a frame. Undoing a session replays its journal backwards. Committing the
    *  outermost session forgets the journal, committing or merging a nested one hands the journal
    *  to the enclosing session. Changes made while no session is open are permanent.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_undo(mv._undo),_active(mv._active)
               {
                  mv._active = false;
               }

               /// a session that is neither committed nor merged is undone
               ~session()
               {
                  if( !_active )
                     return;
                  try {
                     _undo.undo();
                  } catch( const fc::exception& e ) {
                     elog( "Unable to roll back session: ${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }

               session& operator = ( session&& mv )
               {
                  if( this == &mv )
                     return *this;
                  if( _active )
                     _undo.undo();
                  _active = mv._active;
                  mv._active = false;
                  return *this;
               }

               void commit() { if( _active ) _undo.commit(); _active = false; }
               void undo()   { if( _active ) _undo.undo();   _active = false; }
               void merge()  { if( _active ) _undo.merge();  _active = false; }

            private:
               friend class undo_database;
               session( undo_database& u, bool active ):_undo(u),_active(active){}

               undo_database& _undo;
               bool           _active;
         };

         session start_undo_session();

         size_t active_sessions()const { return _frames.size(); }

         /// Called by indexes right after obj was inserted
         void on_create( const object& obj );
         /// Called by indexes right before obj is changed
         void on_modify( const object& obj );
         /// Called by indexes right before obj is erased
         void on_remove( const object& obj );

      private:
         /// innermost open frame, or nullptr when no session is open
         undo_frame* recording();
         void undo();
         void commit();
         void merge();

         object_database&          _db;
         std::vector<undo_frame>   _frames;
   };

} } // dollarstore::db
