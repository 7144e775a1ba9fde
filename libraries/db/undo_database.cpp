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
#include <dollarstore/db/object_database.hpp>
#include <dollarstore/db/undo_database.hpp>

#include <iterator>

namespace dollarstore { namespace db {

undo_database::session undo_database::start_undo_session()
{
   _frames.emplace_back();
   return session( *this, true );
}

undo_frame* undo_database::recording()
{
   if( _frames.empty() )
      return nullptr;
   return &_frames.back();
}

void undo_database::on_create( const object& obj )
{
   undo_frame* frame = recording();
   if( frame == nullptr )
      return;
   frame->journal.push_back( undo_entry{ undo_entry::created, obj.id, nullptr } );
   frame->covered.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   undo_frame* frame = recording();
   if( frame == nullptr || !frame->covered.insert( obj.id ).second )
      return;
   frame->journal.push_back( undo_entry{ undo_entry::modified, obj.id, obj.clone() } );
}

void undo_database::on_remove( const object& obj )
{
   undo_frame* frame = recording();
   if( frame == nullptr )
      return;
   // a removal always needs the object back, even if an earlier entry covers it
   frame->covered.insert( obj.id );
   frame->journal.push_back( undo_entry{ undo_entry::removed, obj.id, obj.clone() } );
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_frames.empty(), "No open session to undo" );
   undo_frame frame = std::move( _frames.back() );
   _frames.pop_back();

   for( auto itr = frame.journal.rbegin(); itr != frame.journal.rend(); ++itr )
      _db.get_mutable_index( itr->id.type() ).revert( *itr );
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( !_frames.empty(), "No open session to commit" );
   if( _frames.size() == 1 )
      _frames.pop_back();
   else
      merge();
}

void undo_database::merge()
{
   FC_ASSERT( _frames.size() >= 2, "Only a nested session can be merged" );
   undo_frame& inner = _frames.back();
   undo_frame& outer = _frames[ _frames.size() - 2 ];
   std::move( inner.journal.begin(), inner.journal.end(), std::back_inserter( outer.journal ) );
   outer.covered.insert( inner.covered.begin(), inner.covered.end() );
   _frames.pop_back();
}

} } // dollarstore::db
