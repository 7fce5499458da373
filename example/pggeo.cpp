//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/geometry/io/wkt/write.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pggeo/extended_error.hpp"
#include "pggeo/format_code.hpp"
#include "pggeo/register.hpp"
#include "pggeo/type_map.hpp"
#include "pggeo/types/geometry.hpp"

using namespace pggeo;

// Stands in for a connection. Answers the OID lookup with the value
// reported by "select 'geometry'::regtype::oid" on your server
struct fixed_oid_lookup
{
    std::uint32_t oid;

    extended_error query_oid(std::string_view query, std::uint32_t& to)
    {
        std::cout << "Running: " << query << '\n';
        to = oid;
        return {};
    }
};

static std::span<const unsigned char> to_span(std::string_view s)
{
    return {reinterpret_cast<const unsigned char*>(s.data()), s.size()};
}

int main(int argc, char** argv)
{
    try
    {
        std::uint32_t oid = argc > 1 ? static_cast<std::uint32_t>(std::stoul(argv[1])) : 16395u;

        // Register the geometry type
        type_map registry;
        fixed_oid_lookup conn{oid};
        throw_on_error(register_geometry(conn, registry));
        std::cout << "Registered geometry with OID " << oid << '\n';

        // Encode a parameter in text format, as it would be sent in a Bind message
        types::polygon poly{
            {{0, 0}, {0, 1}, {1, 1}, {1, 0}, {0, 0}}
        };
        std::vector<unsigned char> buf;
        throw_on_error(registry.encode(oid, format_code::text, poly, buf));
        std::cout << "Encoded " << boost::geometry::wkt(poly) << ": "
                  << std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size()) << '\n';

        // Decode a field, as returned by SELECT 'SRID=4326;POINT(3 4)'::geometry
        types::point p;
        throw_on_error(
            registry.scan(oid, format_code::text, to_span("0101000020e610000000000000000008400000000000001040"), &p)
        );
        std::cout << "Decoded " << boost::geometry::wkt(p) << '\n';

        // Decoding into the wrong variant fails
        types::linestring ls;
        auto err = registry.scan(oid, format_code::text, buf, &ls);
        std::cout << "Decoding a polygon into a linestring: " << err.diag.message() << '\n';
    }
    catch (const std::exception& err)
    {
        std::cerr << "Error: " << err.what() << std::endl;
        return 1;
    }
}
