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
#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/uint128.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/tuple/elem.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <redbank/db/object_id.hpp>
#include <redbank/protocol/config.hpp>

#define REDBANK_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define REDBANK_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            REDBANK_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;

#define REDBANK_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace redbank { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(REDBANK_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(REDBANK_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(redbank::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(REDBANK_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq))

namespace redbank { namespace protocol {
using namespace redbank::db;

using std::map;
using std::vector;
using std::string;
using std::unique_ptr;

using fc::variant_object;
using fc::variant;
using fc::optional;
using fc::time_point_sec;
using fc::safe;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

using share_type = safe<int64_t>;

/// Ledger shares: ma-token balances and scaled debt, both multiplied by REDBANK_MA_TOKEN_SCALING_FACTOR
using scaled_amount_type = fc::uint128_t;

/// Object id spaces: ledger objects live in 1.x.x, bookkeeping singletons in 2.x.x
enum reserved_spaces {
    protocol_ids       = 1,
    implementation_ids = 2
};

bool is_valid_account_name( const string& name );

} }  // redbank::protocol

/// Object types in the Protocol Space (enum object_type (1.x.x))
REDBANK_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                   /* 1.0.x */ (null) // no data
                   /* 1.1.x */ (account)
                   /* 1.2.x */ (market)
                   /* 1.3.x */ (debt)
                   /* 1.4.x */ (collateral)
                   /* 1.5.x */ (uncollateralized_limit)
                   /* 1.6.x */ (account_balance)
                   /* 1.7.x */ (price_feed)
                  )

FC_REFLECT_TYPENAME(redbank::protocol::share_type)
