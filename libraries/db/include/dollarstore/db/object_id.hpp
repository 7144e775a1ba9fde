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
#include <fc/exception/exception.hpp>
#include <fc/io/varint.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>
#include <fc/string.hpp>

namespace dollarstore { namespace db {

   /**
    *  @brief untyped reference to an object held by the object_database
    *
    *  The top byte names the object type, which is also the slot of the index holding it. The
    *  low 56 bits count the instances of that type. The textual form is "type.instance".
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits = 56;
      static constexpr uint64_t instance_mask = ( uint64_t(1) << instance_bits ) - 1;

      object_id_type() = default;
      object_id_type( uint8_t type, uint64_t instance )
      {
         FC_ASSERT( ( instance & ~instance_mask ) == 0, "Object instance ${i} out of range", ("i",instance) );
         number = ( uint64_t(type) << instance_bits ) | instance;
      }

      uint8_t  type()const     { return uint8_t( number >> instance_bits ); }
      uint64_t instance()const { return number & instance_mask; }

      /// id the index hands out after this one
      object_id_type successor()const { return object_id_type( type(), instance() + 1 ); }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      explicit operator std::string()const
      { return fc::to_string( uint64_t( type() ) ) + "." + fc::to_string( instance() ); }

      uint64_t number = 0;
   };

   /// Names the object class a typed id refers to; see DOLLARSTORE_BIND_OBJECT_ID
   template<typename IdType>
   struct object_of_id;

   /**
    *  @brief id of one object type
    *
    *  Typed ids are what operations and objects store. Calling one with a database, as in
    *  `account_id(db)`, returns the object it names.
    */
   template<uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t type_id = TypeID;

      object_id() = default;
      explicit object_id( uint64_t i ):instance(i) {}
      explicit object_id( const object_id_type& id ):instance( id.instance() )
      {
         FC_ASSERT( id.type() == TypeID, "Id ${id} does not name an object of type ${t}",
                    ("id",std::string(id))("t",uint64_t(TypeID)) );
      }

      object_id& operator = ( const object_id_type& id )
      {
         *this = object_id( id );
         return *this;
      }

      explicit operator object_id_type()const { return object_id_type( TypeID, instance.value ); }

      template<typename DB>
      auto operator()( const DB& db )const -> decltype( db.get( *this ) ) { return db.get( *this ); }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator <  ( const object_id& a, const object_id& b )
      { return a.instance.value < b.instance.value; }
      friend bool operator >  ( const object_id& a, const object_id& b )
      { return a.instance.value > b.instance.value; }

      fc::unsigned_int instance;
   };

} } // dollarstore::db

/// Lets db.get() and db.find() return OBJECT for an object_id<OBJECT::type_id>
#define DOLLARSTORE_BIND_OBJECT_ID( OBJECT ) \
   namespace dollarstore { namespace db { \
   template<> struct object_of_id< object_id< OBJECT::type_id > > { using type = OBJECT; }; \
   } }

FC_REFLECT( dollarstore::db::object_id_type, (number) )

namespace fc {

   // object_id is parameterized by a value, which FC_REFLECT cannot express
   template<uint8_t TypeID>
   struct get_typename< dollarstore::db::object_id<TypeID> >
   {
      static const char* name()
      {
         static const std::string n = "dollarstore::db::object_id<" + fc::to_string( uint64_t(TypeID) ) + ">";
         return n.c_str();
      }
   };

   template<uint8_t TypeID>
   struct reflector< dollarstore::db::object_id<TypeID> >
   {
      using type = dollarstore::db::object_id<TypeID>;
      using is_defined = std::true_type;
      using native_members = typelist::list< fc::field_reflection<0, type, unsigned_int, &type::instance> >;
      using inherited_members = typelist::list<>;
      using members = native_members;
      using base_classes = typelist::list<>;
      enum member_count_enum { local_member_count = 1, total_member_count = 1 };

      template<typename Visitor>
      static inline void visit( const Visitor& v )
      {
         v.TEMPLATE operator()<unsigned_int, type, &type::instance>( "instance" );
      }
   };
   namespace member_names {
      template<uint8_t TypeID>
      struct member_name< dollarstore::db::object_id<TypeID>, 0 > { static constexpr const char* value = "instance"; };
   }

   inline void to_variant( const dollarstore::db::object_id_type& id, fc::variant& v, uint32_t max_depth = 1 )
   {
      v = std::string( id );
   }

   inline void from_variant( const fc::variant& v, dollarstore::db::object_id_type& id, uint32_t max_depth = 1 )
   { try {
      const std::string& s = v.get_string();
      const auto dot = s.find( '.' );
      FC_ASSERT( dot != std::string::npos && dot != 0 && dot + 1 < s.size(), "Expected an id of the form type.instance" );
      const uint64_t type = fc::to_uint64( s.substr( 0, dot ) );
      FC_ASSERT( type <= 0xff, "Object type ${t} out of range", ("t",type) );
      id = dollarstore::db::object_id_type( uint8_t(type), fc::to_uint64( s.substr( dot + 1 ) ) );
   } FC_CAPTURE_AND_RETHROW( (v) ) }

   template<uint8_t TypeID>
   void to_variant( const dollarstore::db::object_id<TypeID>& id, fc::variant& v, uint32_t max_depth = 1 )
   {
      v = std::string( dollarstore::db::object_id_type( id ) );
   }

   template<uint8_t TypeID>
   void from_variant( const fc::variant& v, dollarstore::db::object_id<TypeID>& id, uint32_t max_depth = 1 )
   {
      dollarstore::db::object_id_type untyped;
      from_variant( v, untyped, max_depth );
      id = dollarstore::db::object_id<TypeID>( untyped );
   }

} // fc
