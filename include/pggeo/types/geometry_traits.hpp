//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_TYPES_GEOMETRY_TRAITS_HPP
#define PGGEO_TYPES_GEOMETRY_TRAITS_HPP

#include <concepts>
#include <string_view>

#include "pggeo/types/geometry.hpp"

namespace pggeo {
namespace types {

// Compile-time description of the C++ types that can hold a geometry.
// Specializations for concrete variants define kind; the one for geometry accepts any variant.
template <class T>
struct geometry_traits;  // primary template (no definition)

template <>
struct geometry_traits<point>
{
    static constexpr geometry_kind kind = geometry_kind::point;
    static constexpr std::string_view type_name = "pggeo::types::point";
    static constexpr std::string_view pointer_type_name = "pggeo::types::point*";
};

template <>
struct geometry_traits<linestring>
{
    static constexpr geometry_kind kind = geometry_kind::linestring;
    static constexpr std::string_view type_name = "pggeo::types::linestring";
    static constexpr std::string_view pointer_type_name = "pggeo::types::linestring*";
};

template <>
struct geometry_traits<polygon>
{
    static constexpr geometry_kind kind = geometry_kind::polygon;
    static constexpr std::string_view type_name = "pggeo::types::polygon";
    static constexpr std::string_view pointer_type_name = "pggeo::types::polygon*";
};

template <>
struct geometry_traits<multi_point>
{
    static constexpr geometry_kind kind = geometry_kind::multi_point;
    static constexpr std::string_view type_name = "pggeo::types::multi_point";
    static constexpr std::string_view pointer_type_name = "pggeo::types::multi_point*";
};

template <>
struct geometry_traits<multi_linestring>
{
    static constexpr geometry_kind kind = geometry_kind::multi_linestring;
    static constexpr std::string_view type_name = "pggeo::types::multi_linestring";
    static constexpr std::string_view pointer_type_name = "pggeo::types::multi_linestring*";
};

template <>
struct geometry_traits<multi_polygon>
{
    static constexpr geometry_kind kind = geometry_kind::multi_polygon;
    static constexpr std::string_view type_name = "pggeo::types::multi_polygon";
    static constexpr std::string_view pointer_type_name = "pggeo::types::multi_polygon*";
};

template <>
struct geometry_traits<geometry_collection>
{
    static constexpr geometry_kind kind = geometry_kind::geometry_collection;
    static constexpr std::string_view type_name = "pggeo::types::geometry_collection";
    static constexpr std::string_view pointer_type_name = "pggeo::types::geometry_collection*";
};

template <>
struct geometry_traits<geometry>
{
    static constexpr std::string_view type_name = "pggeo::types::geometry";
    static constexpr std::string_view pointer_type_name = "pggeo::types::geometry*";
};

// Any type that can hold a geometry: a concrete variant or geometry itself
template <typename T>
concept geometry_type = requires {
    { geometry_traits<T>::type_name } -> std::convertible_to<std::string_view>;
    { geometry_traits<T>::pointer_type_name } -> std::convertible_to<std::string_view>;
};

// A single, concrete variant
template <typename T>
concept geometry_variant_type = geometry_type<T> && requires {
    { geometry_traits<T>::kind } -> std::convertible_to<geometry_kind>;
};

}  // namespace types
}  // namespace pggeo

#endif
