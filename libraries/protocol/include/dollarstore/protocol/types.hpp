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

#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>


#include <fc/container/flat_fwd.hpp>
#include <fc/io/varint.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/container/flat.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <fc/io/datastream.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/static_variant.hpp>

#include <dollarstore/db/object_id.hpp>
#include <dollarstore/protocol/config.hpp>

#define DOLLARSTORE_EXTERNAL_SERIALIZATION(ext, type) \
namespace fc { \
   ext template void from_variant( const variant& v, type& vo, uint32_t max_depth ); \
   ext template void to_variant( const type& v, variant& vo, uint32_t max_depth ); \
namespace raw { \
   ext template void pack< datastream<size_t>, type >( datastream<size_t>& s, const type& tx, uint32_t _max_depth ); \
   ext template void pack< datastream<char*>, type >( datastream<char*>& s, const type& tx, uint32_t _max_depth ); \
   ext template void unpack< datastream<const char*>, type >( datastream<const char*>& s, type& tx, uint32_t _max_depth ); \
} } // fc::raw
#define DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION(type) DOLLARSTORE_EXTERNAL_SERIALIZATION(extern, type)
#define DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION(type) DOLLARSTORE_EXTERNAL_SERIALIZATION(/*not extern*/, type)

namespace dollarstore { namespace protocol {
using namespace dollarstore::db;

using std::map;
using std::vector;
using std::unordered_map;
using std::string;
using std::deque;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;
using std::tie;
using std::make_pair;

using fc::variant_object;
using fc::variant;
using fc::enum_type;
using fc::optional;
using fc::unsigned_int;
using fc::time_point_sec;
using fc::time_point;
using fc::safe;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;
struct void_t{};

/// Object types operations can name; the value is also the slot of the type's index
enum object_type : uint8_t
{
   null_object_type = 0,
   account_object_type,
   asset_object_type,
   queue_position_object_type,
   stake_object_type,
   OBJECT_TYPE_COUNT ///< first type free for ledger bookkeeping objects
};

using account_id_type        = object_id<account_object_type>;
using asset_id_type          = object_id<asset_object_type>;
using queue_position_id_type = object_id<queue_position_object_type>;
using stake_id_type          = object_id<stake_object_type>;

using share_type = safe<int64_t>;

/// What an asset is used for inside the ledger
enum class asset_kind : uint8_t
{
   reserve   = 0, ///< a stablecoin accepted into the reserve basket
   synthetic = 1, ///< the 1:1 backed synthetic dollar minted on deposit
   reward    = 2  ///< the stakeable reward token minted by the emission allocator
};

} }  // dollarstore::protocol

FC_REFLECT_TYPENAME(dollarstore::protocol::share_type)
FC_REFLECT(dollarstore::protocol::void_t,)
FC_REFLECT_ENUM(dollarstore::protocol::asset_kind, (reserve)(synthetic)(reward))
