//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "pggeo/types/ewkb.hpp"
#include "pggeo/types/geometry.hpp"
#include "pggeo/types/geometry_traits.hpp"
#include "pggeo_internal/ewkb_context.hpp"

using namespace pggeo;
using boost::system::error_code;
using ewkb::byte_order;
using ewkb::detail::parse_context;
using ewkb::detail::serialization_context;
using types::geometry_kind;

namespace {

// EWKB type word flags. The low bits hold the OGC type code
constexpr std::uint32_t z_flag = 0x80000000u;
constexpr std::uint32_t m_flag = 0x40000000u;
constexpr std::uint32_t srid_flag = 0x20000000u;
constexpr std::uint32_t type_mask = 0x0fffffffu;

// Minimum sizes, used to validate element counts
constexpr std::size_t point_size = 16u;                 // x, y
constexpr std::size_t count_size = 4u;                  // empty ring
constexpr std::size_t header_size = 5u;                 // byte order + type word
constexpr std::size_t min_child_size = header_size + 4u;  // empty linestring, polygon or collection
constexpr std::size_t point_child_size = header_size + point_size;

bool is_valid(byte_order order) { return order == byte_order::big || order == byte_order::little; }

//
// Writing
//
void write_header(serialization_context& ctx, geometry_kind kind, std::int32_t srid)
{
    std::uint32_t type_word = static_cast<std::uint32_t>(kind);
    if (srid != 0)
        type_word |= srid_flag;

    ctx.add_byte(static_cast<unsigned char>(ctx.order()));
    ctx.add_integral(type_word);
    if (srid != 0)
        ctx.add_integral(static_cast<std::uint32_t>(srid));
}

void write_point(serialization_context& ctx, const types::point& p)
{
    ctx.add_double(p.x());
    ctx.add_double(p.y());
}

template <class PointRange>
void write_points(serialization_context& ctx, const PointRange& points)
{
    ctx.add_count(points.size());
    for (const auto& p : points)
        write_point(ctx, p);
}

void write_geometry(serialization_context& ctx, const types::geometry& g, std::int32_t srid, std::size_t depth);

template <types::geometry_variant_type G>
void write_geometry(serialization_context& ctx, const G& g, std::int32_t srid, std::size_t depth);

template <class Multi>
void write_children(serialization_context& ctx, const Multi& children, std::size_t depth)
{
    ctx.add_count(children.size());
    for (const auto& child : children)
        write_geometry(ctx, child, 0, depth + 1u);
}

// clang-format off
void write_body(serialization_context& ctx, const types::point& g, std::size_t) { write_point(ctx, g); }
void write_body(serialization_context& ctx, const types::linestring& g, std::size_t) { write_points(ctx, g); }
void write_body(serialization_context& ctx, const types::multi_point& g, std::size_t depth) { write_children(ctx, g, depth); }
void write_body(serialization_context& ctx, const types::multi_linestring& g, std::size_t depth) { write_children(ctx, g, depth); }
void write_body(serialization_context& ctx, const types::multi_polygon& g, std::size_t depth) { write_children(ctx, g, depth); }
void write_body(serialization_context& ctx, const types::geometry_collection& g, std::size_t depth) { write_children(ctx, g, depth); }
// clang-format on

void write_body(serialization_context& ctx, const types::polygon& g, std::size_t)
{
    // POLYGON EMPTY has no rings at all
    if (g.outer().empty() && g.inners().empty())
    {
        ctx.add_count(0u);
        return;
    }

    ctx.add_count(g.inners().size() + 1u);
    write_points(ctx, g.outer());
    for (const auto& ring : g.inners())
        write_points(ctx, ring);
}

template <types::geometry_variant_type G>
void write_geometry(serialization_context& ctx, const G& g, std::int32_t srid, std::size_t depth)
{
    if (depth > ewkb::max_nesting_depth)
    {
        ctx.add_error(ewkb_errc::nesting_too_deep);
        return;
    }
    write_header(ctx, types::geometry_traits<G>::kind, srid);
    write_body(ctx, g, depth);
}

void write_geometry(serialization_context& ctx, const types::geometry& g, std::int32_t srid, std::size_t depth)
{
    boost::variant2::visit([&](const auto& alt) { write_geometry(ctx, alt, srid, depth); }, g.variant());
}

template <class G>
error_code marshal_impl(const G& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to)
{
    if (!is_valid(order))
        return ewkb_errc::invalid_byte_order;
    serialization_context ctx(to, order);
    write_geometry(ctx, from, srid, 0u);
    return ctx.error();
}

//
// Reading
//
struct header
{
    byte_order order{};
    geometry_kind kind{};
    std::int32_t srid{};
};

header parse_header(parse_context& ctx)
{
    header res;

    auto marker = ctx.get_byte();
    if (ctx.error())
        return res;
    res.order = static_cast<byte_order>(marker);
    if (!is_valid(res.order))
    {
        ctx.add_error(ewkb_errc::invalid_byte_order);
        return res;
    }

    auto type_word = ctx.get_integral<std::uint32_t>(res.order);
    if (ctx.error())
        return res;

    if (type_word & (z_flag | m_flag))
    {
        ctx.add_error(ewkb_errc::unsupported_dimensions);
        return res;
    }

    // ISO WKB encodes dimensions as 1000 (Z), 2000 (M) and 3000 (ZM) added to the type code
    auto code = type_word & type_mask;
    if (code >= 1000u)
    {
        bool iso_dims = code < 4000u && code % 1000u >= 1u && code % 1000u <= 7u;
        ctx.add_error(iso_dims ? ewkb_errc::unsupported_dimensions : ewkb_errc::unsupported_geometry_type);
        return res;
    }
    if (code < 1u || code > 7u)
    {
        ctx.add_error(ewkb_errc::unsupported_geometry_type);
        return res;
    }
    res.kind = static_cast<geometry_kind>(code);

    // Nested geometries shouldn't carry a SRID, but tolerate it
    if (type_word & srid_flag)
        res.srid = static_cast<std::int32_t>(ctx.get_integral<std::uint32_t>(res.order));

    return res;
}

types::point parse_point(parse_context& ctx, byte_order order)
{
    double x = ctx.get_double(order);
    double y = ctx.get_double(order);
    return types::point(x, y);
}

template <class PointRange>
void parse_points(parse_context& ctx, byte_order order, PointRange& to)
{
    auto n = ctx.get_count(order, point_size);
    to.reserve(n);
    for (std::uint32_t i = 0u; i < n && !ctx.error(); ++i)
        to.push_back(parse_point(ctx, order));
}

types::geometry parse_geometry(parse_context& ctx, std::size_t depth, std::int32_t& srid);

template <class Child>
void parse_child(parse_context& ctx, std::size_t depth, Child& to);

void parse_child(parse_context& ctx, std::size_t depth, types::geometry& to);

template <class Multi>
void parse_children(parse_context& ctx, byte_order order, std::size_t depth, std::size_t min_size, Multi& to)
{
    auto n = ctx.get_count(order, min_size);
    to.reserve(n);
    for (std::uint32_t i = 0u; i < n && !ctx.error(); ++i)
    {
        typename Multi::value_type child{};
        parse_child(ctx, depth + 1u, child);
        to.push_back(std::move(child));
    }
}

void parse_body(parse_context& ctx, byte_order order, std::size_t, types::point& to)
{
    to = parse_point(ctx, order);
}

void parse_body(parse_context& ctx, byte_order order, std::size_t, types::linestring& to)
{
    parse_points(ctx, order, to);
}

void parse_body(parse_context& ctx, byte_order order, std::size_t, types::polygon& to)
{
    auto num_rings = ctx.get_count(order, count_size);
    for (std::uint32_t i = 0u; i < num_rings && !ctx.error(); ++i)
    {
        if (i == 0u)
        {
            parse_points(ctx, order, to.outer());
        }
        else
        {
            to.inners().emplace_back();
            parse_points(ctx, order, to.inners().back());
        }
    }
}

void parse_body(parse_context& ctx, byte_order order, std::size_t depth, types::multi_point& to)
{
    parse_children(ctx, order, depth, point_child_size, to);
}

void parse_body(parse_context& ctx, byte_order order, std::size_t depth, types::multi_linestring& to)
{
    parse_children(ctx, order, depth, min_child_size, to);
}

void parse_body(parse_context& ctx, byte_order order, std::size_t depth, types::multi_polygon& to)
{
    parse_children(ctx, order, depth, min_child_size, to);
}

void parse_body(parse_context& ctx, byte_order order, std::size_t depth, types::geometry_collection& to)
{
    parse_children(ctx, order, depth, min_child_size, to);
}

// Elements of multi geometries must be of the matching simple kind
template <class Child>
void parse_child(parse_context& ctx, std::size_t depth, Child& to)
{
    if (depth > ewkb::max_nesting_depth)
    {
        ctx.add_error(ewkb_errc::nesting_too_deep);
        return;
    }
    auto h = parse_header(ctx);
    if (ctx.error())
        return;
    if (h.kind != types::geometry_traits<Child>::kind)
    {
        ctx.add_error(ewkb_errc::unsupported_geometry_type);
        return;
    }
    parse_body(ctx, h.order, depth, to);
}

// Elements of collections may be anything
void parse_child(parse_context& ctx, std::size_t depth, types::geometry& to)
{
    std::int32_t ignored_srid{};
    to = parse_geometry(ctx, depth, ignored_srid);
}

template <class G>
types::geometry parse_alternative(parse_context& ctx, byte_order order, std::size_t depth)
{
    G res{};
    parse_body(ctx, order, depth, res);
    return types::geometry(std::move(res));
}

types::geometry parse_geometry(parse_context& ctx, std::size_t depth, std::int32_t& srid)
{
    if (depth > ewkb::max_nesting_depth)
    {
        ctx.add_error(ewkb_errc::nesting_too_deep);
        return {};
    }

    auto h = parse_header(ctx);
    if (ctx.error())
        return {};
    srid = h.srid;

    switch (h.kind)
    {
        case geometry_kind::point: return parse_alternative<types::point>(ctx, h.order, depth);
        case geometry_kind::linestring: return parse_alternative<types::linestring>(ctx, h.order, depth);
        case geometry_kind::polygon: return parse_alternative<types::polygon>(ctx, h.order, depth);
        case geometry_kind::multi_point: return parse_alternative<types::multi_point>(ctx, h.order, depth);
        case geometry_kind::multi_linestring:
            return parse_alternative<types::multi_linestring>(ctx, h.order, depth);
        case geometry_kind::multi_polygon:
            return parse_alternative<types::multi_polygon>(ctx, h.order, depth);
        case geometry_kind::geometry_collection:
            return parse_alternative<types::geometry_collection>(ctx, h.order, depth);
        default: ctx.add_error(ewkb_errc::unsupported_geometry_type); return {};
    }
}

}  // namespace

// clang-format off
error_code ewkb::marshal(const types::geometry& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
error_code ewkb::marshal(const types::point& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
error_code ewkb::marshal(const types::linestring& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
error_code ewkb::marshal(const types::polygon& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
error_code ewkb::marshal(const types::multi_point& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
error_code ewkb::marshal(const types::multi_linestring& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
error_code ewkb::marshal(const types::multi_polygon& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
error_code ewkb::marshal(const types::geometry_collection& from, std::int32_t srid, byte_order order, std::vector<unsigned char>& to) { return marshal_impl(from, srid, order, to); }
// clang-format on

error_code ewkb::unmarshal(std::span<const unsigned char> from, unmarshal_result& to)
{
    parse_context ctx(from);
    std::int32_t srid{};
    auto geom = parse_geometry(ctx, 0u, srid);
    if (ctx.error())
        return ctx.error();

    to.geom = std::move(geom);
    to.srid = srid;
    to.bytes_consumed = ctx.consumed();
    return {};
}
