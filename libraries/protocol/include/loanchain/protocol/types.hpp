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
#include <loanchain/db/object_id.hpp>
#include <loanchain/protocol/config.hpp>

#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <boost/multiprecision/cpp_int.hpp>
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

#define LOANCHAIN_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define LOANCHAIN_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define LOANCHAIN_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            LOANCHAIN_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define LOANCHAIN_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(loanchain::id_namespace::name)

/// Declares the object type enum of one id space together with a typed id for each entry
#define LOANCHAIN_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace loanchain { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(LOANCHAIN_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(LOANCHAIN_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(loanchain::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(LOANCHAIN_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(LOANCHAIN_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(LOANCHAIN_NAME_TO_ID_TYPE, , names_seq))

namespace loanchain { namespace protocol {
using namespace loanchain::db;

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::pair;

using fc::variant_object;
using fc::variant;
using fc::optional;
using fc::unsigned_int;
using fc::time_point_sec;
using fc::time_point;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

struct void_t{};

enum reserved_spaces {
    relative_protocol_ids = 0,
    protocol_ids          = 1,
    implementation_ids    = 2
};

/// Raw token amount in the smallest unit of its token. Valid amounts fit into 128 bits.
using amount_type = boost::multiprecision::uint256_t;
/// Intermediate type for products of two amounts
using wide_amount_type = boost::multiprecision::uint512_t;

amount_type max_amount();
bool        is_valid_amount( const amount_type& a );
/// 10^exp, exp must not exceed 38
amount_type pow10( uint8_t exp );
/// floor( a * b / c ), the result must be a valid amount
amount_type mul_div( const amount_type& a, const amount_type& b, const amount_type& c );

} }  // loanchain::protocol

namespace fc {
void to_variant( const loanchain::protocol::amount_type& var, fc::variant& vo, uint32_t max_depth = 1 );
void from_variant( const fc::variant& var, loanchain::protocol::amount_type& vo, uint32_t max_depth = 1 );
} // fc

/// Object types in the Protocol Space (enum object_type (1.x.x))
LOANCHAIN_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                     /* 1.0.x */ (null) // no data
                     /* 1.1.x */ (account)
                     /* 1.2.x */ (token)
                     /* 1.3.x */ (price_feed)
                     /* 1.4.x */ (loan)
                     /* 1.5.x */ (loan_contribution)
                     /* 1.6.x */ (loan_vote)
                    )

FC_REFLECT_TYPENAME( loanchain::protocol::amount_type )
FC_REFLECT( loanchain::protocol::void_t, )
