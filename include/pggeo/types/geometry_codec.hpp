//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_TYPES_GEOMETRY_CODEC_HPP
#define PGGEO_TYPES_GEOMETRY_CODEC_HPP

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "pggeo/codec.hpp"

namespace pggeo {
namespace types {

// Raw EWKB, as produced by PostGIS' geometry_send
class geometry_binary_encode_plan final : public encode_plan
{
public:
    extended_error encode(value_ref value, std::vector<unsigned char>& buf) const override;
};

// Lower-case hex EWKB, as produced by PostGIS' geometry_out
class geometry_text_encode_plan final : public encode_plan
{
public:
    extended_error encode(value_ref value, std::vector<unsigned char>& buf) const override;
};

class geometry_binary_scan_plan final : public scan_plan
{
public:
    extended_error scan(std::span<const unsigned char> src, target_ref target) const override;
};

class geometry_text_scan_plan final : public scan_plan
{
public:
    extended_error scan(std::span<const unsigned char> src, target_ref target) const override;
};

// Codec for the PostGIS geometry type. Its OID is assigned when the
// extension is installed, so it must be looked up (see register_geometry).
class geometry_codec final : public codec
{
public:
    bool supports(format_code fmt) const override;

    format_code preferred_format() const override { return format_code::binary; }

    const encode_plan* plan_encode(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        value_ref value
    ) const override;

    const scan_plan* plan_scan(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        target_ref target
    ) const override;

    extended_error decode_value(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        std::span<const unsigned char> src,
        geometry& to
    ) const override;

    // Not supported: geometries have no database/sql representation
    extended_error decode_database_sql_value(
        const type_map& registry,
        std::uint32_t oid,
        format_code fmt,
        std::span<const unsigned char> src,
        std::string& to
    ) const override;
};

}  // namespace types
}  // namespace pggeo

#endif
