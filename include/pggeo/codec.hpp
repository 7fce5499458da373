//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_CODEC_HPP
#define PGGEO_CODEC_HPP

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "pggeo/extended_error.hpp"
#include "pggeo/format_code.hpp"
#include "pggeo/target_ref.hpp"
#include "pggeo/types/geometry.hpp"
#include "pggeo/value_ref.hpp"

namespace pggeo {

class type_map;

// Serializes a parameter value, as chosen by codec::plan_encode.
// Plans are stateless and may be reused across calls and threads.
class encode_plan
{
public:
    virtual ~encode_plan() = default;

    // Appends the serialized value to buf
    virtual extended_error encode(value_ref value, std::vector<unsigned char>& buf) const = 0;
};

// Parses a field value into a destination, as chosen by codec::plan_scan.
// An empty src stands for SQL NULL.
class scan_plan
{
public:
    virtual ~scan_plan() = default;

    virtual extended_error scan(std::span<const unsigned char> src, target_ref target) const = 0;
};

// Knows how to convert values of a server type. Registered with a type_map
// under the type's OID, which is passed back to every call.
class codec
{
public:
    virtual ~codec() = default;

    virtual bool supports(format_code fmt) const = 0;

    virtual format_code preferred_format() const = 0;

    // Returns nullptr if the value can't be encoded in this format
    virtual const encode_plan* plan_encode(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        value_ref value
    ) const = 0;

    // Returns nullptr if the format is not supported
    virtual const scan_plan* plan_scan(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        target_ref target
    ) const = 0;

    // Decodes a field into a generic value, without a typed destination
    virtual extended_error decode_value(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        std::span<const unsigned char> src,
        types::geometry& to
    ) const = 0;

    // Decodes a field into the representation used by database/sql style drivers
    virtual extended_error decode_database_sql_value(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        std::span<const unsigned char> src,
        std::string& to
    ) const = 0;
};

}  // namespace pggeo

#endif
