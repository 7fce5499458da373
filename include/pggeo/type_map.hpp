//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_TYPE_MAP_HPP
#define PGGEO_TYPE_MAP_HPP

#include <boost/container/small_vector.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pggeo/codec.hpp"
#include "pggeo/extended_error.hpp"
#include "pggeo/format_code.hpp"
#include "pggeo/target_ref.hpp"
#include "pggeo/types/geometry.hpp"
#include "pggeo/value_ref.hpp"

namespace pggeo {

// A server type, as known to a connection
struct pg_type
{
    std::string name;
    std::shared_ptr<const ::pggeo::codec> codec;
    std::uint32_t oid{};
};

// The per-connection registry of types, keyed by OID and by name.
// Not thread-safe: populate it before sharing it.
class type_map
{
    boost::container::small_vector<pg_type, 4u> types_;

public:
    type_map() = default;

    // Adds a type. An existing entry with the same OID or name is replaced
    void register_type(pg_type type);

    // nullptr if not found
    const pg_type* type_for_oid(std::uint32_t oid) const noexcept;
    const pg_type* type_for_name(std::string_view name) const noexcept;

    // The format to request for fields of this type. Text for unknown types
    format_code preferred_format(std::uint32_t oid) const;

    // nullptr if the type is unknown or its codec doesn't offer a plan
    const encode_plan* plan_encode(std::uint32_t oid, format_code fmt, value_ref value) const;
    const scan_plan* plan_scan(std::uint32_t oid, format_code fmt, target_ref target) const;

    // Plan and run in one go
    extended_error encode(std::uint32_t oid, format_code fmt, value_ref value, std::vector<unsigned char>& buf)
        const;

    // src is std::nullopt for SQL NULL
    extended_error scan(
        std::uint32_t oid,
        format_code fmt,
        std::optional<std::span<const unsigned char>> src,
        target_ref target
    ) const;

    extended_error decode_value(
        std::uint32_t oid,
        format_code fmt,
        std::span<const unsigned char> src,
        types::geometry& to
    ) const;
};

}  // namespace pggeo

#endif
