//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_REGISTER_HPP
#define PGGEO_REGISTER_HPP

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

#include "pggeo/extended_error.hpp"
#include "pggeo/type_map.hpp"

namespace pggeo {

struct register_options
{
    // Name of the type, as created by CREATE EXTENSION postgis.
    // May be schema-qualified
    std::string type_name{"geometry"};

    // Query returning the type's OID as a single scalar.
    // If empty, one is built from type_name (see oid_lookup_query)
    std::string lookup_query{};
};

// Something that can run a query returning a single OID, like a connection
template <class T>
concept oid_lookup = requires(T& conn, std::string_view query, std::uint32_t& oid) {
    { conn.query_oid(query, oid) } -> std::convertible_to<extended_error>;
};

// Type-erased reference to an oid_lookup
class oid_lookup_ref
{
    using query_oid_fn = extended_error (*)(void*, std::string_view, std::uint32_t&);

    void* obj_;
    query_oid_fn query_oid_;

    template <class T>
    static extended_error do_query_oid(void* obj, std::string_view query, std::uint32_t& oid)
    {
        return static_cast<T*>(obj)->query_oid(query, oid);
    }

public:
    template <oid_lookup T>
        requires(!std::same_as<T, oid_lookup_ref>)
    oid_lookup_ref(T& obj) noexcept : obj_(&obj), query_oid_(&do_query_oid<T>)
    {
    }

    extended_error query_oid(std::string_view query, std::uint32_t& oid) const
    {
        return query_oid_(obj_, query, oid);
    }
};

// The query used to resolve the geometry type's OID
std::string oid_lookup_query(const register_options& opts);

// Looks up the geometry type's OID and registers a geometry_codec for it.
// On failure, registry is left untouched.
extended_error register_geometry(oid_lookup_ref conn, type_map& registry, const register_options& opts = {});

}  // namespace pggeo

#endif
