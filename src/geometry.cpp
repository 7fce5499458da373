//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "pggeo/types/geometry.hpp"
#include "pggeo/types/geometry_traits.hpp"

using namespace pggeo::types;

namespace {

bool coord_equal(double lhs, double rhs) noexcept
{
    if (std::isnan(lhs) && std::isnan(rhs))
        return true;
    return std::bit_cast<std::uint64_t>(lhs) == std::bit_cast<std::uint64_t>(rhs);
}

bool equal(const point& lhs, const point& rhs) noexcept
{
    return coord_equal(lhs.x(), rhs.x()) && coord_equal(lhs.y(), rhs.y());
}

bool equal(const geometry& lhs, const geometry& rhs) noexcept { return exactly_equal(lhs, rhs); }

bool equal(const linear_ring& lhs, const linear_ring& rhs) noexcept;
bool equal(const linestring& lhs, const linestring& rhs) noexcept;
bool equal(const polygon& lhs, const polygon& rhs) noexcept;

template <class Range>
bool equal_ranges(const Range& lhs, const Range& rhs) noexcept
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](const auto& a, const auto& b) {
        return equal(a, b);
    });
}

// clang-format off
bool equal(const linestring& lhs, const linestring& rhs) noexcept { return equal_ranges(lhs, rhs); }
bool equal(const polygon& lhs, const polygon& rhs) noexcept { return equal(lhs.outer(), rhs.outer()) && equal_ranges(lhs.inners(), rhs.inners()); }
bool equal(const multi_point& lhs, const multi_point& rhs) noexcept { return equal_ranges(lhs, rhs); }
bool equal(const multi_linestring& lhs, const multi_linestring& rhs) noexcept { return equal_ranges(lhs, rhs); }
bool equal(const multi_polygon& lhs, const multi_polygon& rhs) noexcept { return equal_ranges(lhs, rhs); }
bool equal(const geometry_collection& lhs, const geometry_collection& rhs) noexcept { return equal_ranges(lhs, rhs); }
bool equal(const linear_ring& lhs, const linear_ring& rhs) noexcept { return equal_ranges(lhs, rhs); }
// clang-format on

}  // namespace

std::string_view pggeo::types::type_name(geometry_kind kind) noexcept
{
    switch (kind)
    {
        case geometry_kind::point: return geometry_traits<point>::type_name;
        case geometry_kind::linestring: return geometry_traits<linestring>::type_name;
        case geometry_kind::polygon: return geometry_traits<polygon>::type_name;
        case geometry_kind::multi_point: return geometry_traits<multi_point>::type_name;
        case geometry_kind::multi_linestring: return geometry_traits<multi_linestring>::type_name;
        case geometry_kind::multi_polygon: return geometry_traits<multi_polygon>::type_name;
        case geometry_kind::geometry_collection: return geometry_traits<geometry_collection>::type_name;
        default: return "<unknown geometry_kind>";
    }
}

bool pggeo::types::exactly_equal(const geometry& lhs, const geometry& rhs) noexcept
{
    if (lhs.kind() != rhs.kind())
        return false;
    return boost::variant2::visit(
        [&rhs](const auto& l) {
            using T = std::decay_t<decltype(l)>;
            return equal(l, *rhs.get_if<T>());
        },
        lhs.variant()
    );
}
