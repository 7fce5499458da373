//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_TYPES_GEOMETRY_HPP
#define PGGEO_TYPES_GEOMETRY_HPP

#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/ring.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pggeo {
namespace types {

// 2D cartesian geometries, as stored in a PostGIS geometry column
using point = boost::geometry::model::d2::point_xy<double>;
using linestring = boost::geometry::model::linestring<point>;
using linear_ring = boost::geometry::model::ring<point>;
using polygon = boost::geometry::model::polygon<point>;
using multi_point = boost::geometry::model::multi_point<point>;
using multi_linestring = boost::geometry::model::multi_linestring<linestring>;
using multi_polygon = boost::geometry::model::multi_polygon<polygon>;

class geometry;

struct geometry_collection : std::vector<geometry>
{
    using std::vector<geometry>::vector;
};

// Discriminant of a geometry. Values match the WKB type codes
enum class geometry_kind : std::uint8_t
{
    point = 1,
    linestring = 2,
    polygon = 3,
    multi_point = 4,
    multi_linestring = 5,
    multi_polygon = 6,
    geometry_collection = 7,
};

// Name of the C++ type holding a geometry of the given kind
std::string_view type_name(geometry_kind kind) noexcept;

// Any geometry. Alternatives are in geometry_kind order
class geometry
{
public:
    using variant_type = boost::variant2::variant<
        point,
        linestring,
        polygon,
        multi_point,
        multi_linestring,
        multi_polygon,
        geometry_collection>;

private:
    variant_type impl_;

public:
    // An empty collection
    geometry() : impl_(geometry_collection{}) {}

    template <class T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, geometry> &&
                 std::is_constructible_v<variant_type, T &&>)
    geometry(T&& value) : impl_(std::forward<T>(value))
    {
    }

    geometry_kind kind() const noexcept { return static_cast<geometry_kind>(impl_.index() + 1u); }

    template <class T>
    bool holds() const noexcept
    {
        return boost::variant2::holds_alternative<T>(impl_);
    }

    template <class T>
    T* get_if() noexcept
    {
        return boost::variant2::get_if<T>(&impl_);
    }

    template <class T>
    const T* get_if() const noexcept
    {
        return boost::variant2::get_if<T>(&impl_);
    }

    variant_type& variant() noexcept { return impl_; }
    const variant_type& variant() const noexcept { return impl_; }
};

// Structural equality: same kinds all the way down and bitwise-identical coordinates.
// NaN coordinates (WKB's empty point) compare equal to each other.
bool exactly_equal(const geometry& lhs, const geometry& rhs) noexcept;

}  // namespace types
}  // namespace pggeo

#endif
