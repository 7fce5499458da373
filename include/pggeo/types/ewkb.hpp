//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_TYPES_EWKB_HPP
#define PGGEO_TYPES_EWKB_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "pggeo/types/geometry.hpp"

namespace pggeo {

const boost::system::error_category& get_ewkb_category();

enum class ewkb_errc : int
{
    // The input ended in the middle of a geometry
    incomplete_data = 1,

    // The byte order marker was neither 0 (XDR) nor 1 (NDR)
    invalid_byte_order,

    // The type code is not one of the seven OGC geometry types
    unsupported_geometry_type,

    // The geometry has Z and/or M coordinates. Only 2D geometries are supported
    unsupported_dimensions,

    // A point, ring or geometry count doesn't fit in the remaining input
    invalid_element_count,

    // Geometry collections are nested deeper than max_nesting_depth
    nesting_too_deep,

    // A collection has more elements than a WKB count can represent
    value_too_big,
};

inline boost::system::error_code make_error_code(ewkb_errc error)
{
    return boost::system::error_code(static_cast<int>(error), get_ewkb_category());
}

}  // namespace pggeo

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::pggeo::ewkb_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

namespace pggeo {
namespace ewkb {

// Byte order marker, the first byte of every (E)WKB geometry
enum class byte_order : std::uint8_t
{
    big = 0,     // XDR
    little = 1,  // NDR
};

// What the codec uses when encoding. PostGIS itself emits NDR.
inline constexpr std::int32_t default_srid = 4326;
inline constexpr byte_order default_byte_order = byte_order::little;

// Limit on geometry collection nesting, both when reading and writing
inline constexpr std::size_t max_nesting_depth = 32u;

// Appends the EWKB form of the geometry to the supplied buffer.
// An srid of 0 produces plain WKB (no SRID flag). On error, the buffer contents are unspecified.
boost::system::error_code marshal(
    const types::geometry& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);
boost::system::error_code marshal(
    const types::point& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);
boost::system::error_code marshal(
    const types::linestring& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);
boost::system::error_code marshal(
    const types::polygon& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);
boost::system::error_code marshal(
    const types::multi_point& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);
boost::system::error_code marshal(
    const types::multi_linestring& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);
boost::system::error_code marshal(
    const types::multi_polygon& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);
boost::system::error_code marshal(
    const types::geometry_collection& from,
    std::int32_t srid,
    byte_order order,
    std::vector<unsigned char>& to
);

struct unmarshal_result
{
    types::geometry geom;

    // 0 if the input was plain WKB
    std::int32_t srid{};

    // Bytes taken by the geometry. Anything after them is left alone
    std::size_t bytes_consumed{};
};

// Parses one (E)WKB geometry from the start of the input
[[nodiscard]] boost::system::error_code unmarshal(std::span<const unsigned char> from, unmarshal_result& to);

}  // namespace ewkb
}  // namespace pggeo

#endif
