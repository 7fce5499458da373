//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <cstdint>
#include <memory>
#include <string>

#include "pggeo/extended_error.hpp"
#include "pggeo/register.hpp"
#include "pggeo/type_map.hpp"
#include "pggeo/types/geometry_codec.hpp"

using namespace pggeo;

std::string pggeo::oid_lookup_query(const register_options& opts)
{
    if (!opts.lookup_query.empty())
        return opts.lookup_query;

    // Quote the name as a string literal
    std::string res = "select '";
    for (char c : opts.type_name)
    {
        if (c == '\'')
            res.push_back('\'');
        res.push_back(c);
    }
    res += "'::text::regtype::oid";
    return res;
}

extended_error pggeo::register_geometry(oid_lookup_ref conn, type_map& registry, const register_options& opts)
{
    std::uint32_t oid{};
    auto err = conn.query_oid(oid_lookup_query(opts), oid);
    if (err.code)
    {
        err.diag.add_context("get geometry oid failed", err.code);
        return err;
    }

    registry.register_type({opts.type_name, std::make_shared<types::geometry_codec>(), oid});
    return {};
}
