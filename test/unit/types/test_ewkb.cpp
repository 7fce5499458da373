//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "pggeo/types/ewkb.hpp"
#include "pggeo/types/geometry.hpp"
#include "printing.hpp"
#include "test_utils.hpp"

using namespace pggeo;
using namespace pggeo::types;
using boost::system::error_code;
using pggeo::test::from_hex;

namespace {

// What PostGIS returns for SELECT 'SRID=4326;POINT(3 4)'::geometry
constexpr std::string_view postgis_point = "0101000020e610000000000000000008400000000000001040";

geometry nested_collection(std::size_t depth)
{
    geometry res = geometry_collection{};
    for (std::size_t i = 0; i < depth; ++i)
        res = geometry_collection{res};
    return res;
}

//
// marshal
//
void test_marshal_postgis_point()
{
    std::vector<unsigned char> buf;
    auto expected = from_hex(postgis_point);

    auto ec = ewkb::marshal(point(3, 4), 4326, ewkb::byte_order::little, buf);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_ALL_EQ(buf.begin(), buf.end(), expected.begin(), expected.end());
}

// A zero SRID produces plain WKB
void test_marshal_plain_wkb_big_endian()
{
    std::vector<unsigned char> buf;
    auto expected = from_hex("00000000013ff00000000000004000000000000000");

    auto ec = ewkb::marshal(point(1, 2), 0, ewkb::byte_order::big, buf);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_ALL_EQ(buf.begin(), buf.end(), expected.begin(), expected.end());
}

void test_marshal_linestring()
{
    std::vector<unsigned char> buf;
    auto expected = from_hex(
        "0102000020e610000002000000"
        "00000000000000000000000000000000"
        "000000000000f03f000000000000f03f"
    );

    auto ec = ewkb::marshal(linestring{{0, 0}, {1, 1}}, 4326, ewkb::byte_order::little, buf);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_ALL_EQ(buf.begin(), buf.end(), expected.begin(), expected.end());
}

// An empty polygon has no rings
void test_marshal_empty_polygon()
{
    std::vector<unsigned char> buf;
    auto expected = from_hex("010300000000000000");

    auto ec = ewkb::marshal(polygon{}, 0, ewkb::byte_order::little, buf);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_ALL_EQ(buf.begin(), buf.end(), expected.begin(), expected.end());
}

// Only the outermost geometry carries the SRID
void test_marshal_collection_srid()
{
    std::vector<unsigned char> buf;
    auto expected = from_hex(
        "0107000020e610000001000000"
        "0101000000000000000000f03f0000000000000040"
    );

    auto ec = ewkb::marshal(geometry(geometry_collection{point(1, 2)}), 4326, ewkb::byte_order::little, buf);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_ALL_EQ(buf.begin(), buf.end(), expected.begin(), expected.end());
}

// Marshal appends to the buffer
void test_marshal_non_empty_buffer()
{
    std::vector<unsigned char> buf{0xaa};

    auto ec = ewkb::marshal(point(3, 4), 4326, ewkb::byte_order::little, buf);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_EQ(buf.size(), 26u);
    BOOST_TEST_EQ(buf.front(), 0xaa);
}

void test_marshal_invalid_byte_order()
{
    std::vector<unsigned char> buf;

    auto ec = ewkb::marshal(point(3, 4), 4326, static_cast<ewkb::byte_order>(2), buf);

    BOOST_TEST_EQ(ec, error_code(ewkb_errc::invalid_byte_order));
    BOOST_TEST(buf.empty());
}

void test_marshal_nesting()
{
    std::vector<unsigned char> buf;
    BOOST_TEST_EQ(
        ewkb::marshal(nested_collection(ewkb::max_nesting_depth), 0, ewkb::byte_order::little, buf),
        error_code()
    );

    buf.clear();
    BOOST_TEST_EQ(
        ewkb::marshal(nested_collection(ewkb::max_nesting_depth + 1u), 0, ewkb::byte_order::little, buf),
        error_code(ewkb_errc::nesting_too_deep)
    );
}

//
// unmarshal
//
void test_unmarshal_postgis_point()
{
    auto input = from_hex(postgis_point);
    ewkb::unmarshal_result res;

    auto ec = ewkb::unmarshal(input, res);

    BOOST_TEST_EQ(ec, error_code());
    PGGEO_TEST_GEOM_EQ(res.geom, point(3, 4))
    BOOST_TEST_EQ(res.srid, 4326);
    BOOST_TEST_EQ(res.bytes_consumed, 25u);
}

void test_unmarshal_plain_wkb_big_endian()
{
    auto input = from_hex("00000000013ff00000000000004000000000000000");
    ewkb::unmarshal_result res;

    auto ec = ewkb::unmarshal(input, res);

    BOOST_TEST_EQ(ec, error_code());
    PGGEO_TEST_GEOM_EQ(res.geom, point(1, 2))
    BOOST_TEST_EQ(res.srid, 0);
}

// Each nested geometry carries its own byte order marker
void test_unmarshal_mixed_byte_order()
{
    auto input = from_hex(
        "000000000400000001"
        "0101000000000000000000f03f0000000000000040"
    );
    ewkb::unmarshal_result res;

    auto ec = ewkb::unmarshal(input, res);

    BOOST_TEST_EQ(ec, error_code());
    PGGEO_TEST_GEOM_EQ(res.geom, multi_point{point(1, 2)})
}

// Anything after the geometry is not consumed
void test_unmarshal_trailing_bytes()
{
    auto input = from_hex(postgis_point);
    input.push_back(0xff);
    input.push_back(0xff);
    ewkb::unmarshal_result res;

    auto ec = ewkb::unmarshal(input, res);

    BOOST_TEST_EQ(ec, error_code());
    BOOST_TEST_EQ(res.bytes_consumed, 25u);
}

// POINT EMPTY is encoded as NaN coordinates
void test_unmarshal_empty_point()
{
    auto input = from_hex("0101000000000000000000f87f000000000000f87f");
    ewkb::unmarshal_result res;

    auto ec = ewkb::unmarshal(input, res);

    BOOST_TEST_EQ(ec, error_code());
    const auto* p = res.geom.get_if<point>();
    if (BOOST_TEST(p != nullptr))
    {
        BOOST_TEST(std::isnan(p->x()));
        BOOST_TEST(std::isnan(p->y()));
    }
}

void test_unmarshal_empty_polygon()
{
    auto input = from_hex("010300000000000000");
    ewkb::unmarshal_result res;

    auto ec = ewkb::unmarshal(input, res);

    BOOST_TEST_EQ(ec, error_code());
    PGGEO_TEST_GEOM_EQ(res.geom, polygon{})
}

void test_unmarshal_nesting()
{
    // One collection inside another, max_nesting_depth + 1 times
    std::string hex;
    for (std::size_t i = 0; i <= ewkb::max_nesting_depth; ++i)
        hex += "010700000001000000";
    hex += "010700000000000000";
    auto input = from_hex(hex);
    ewkb::unmarshal_result res;

    auto ec = ewkb::unmarshal(input, res);

    BOOST_TEST_EQ(ec, error_code(ewkb_errc::nesting_too_deep));
}

void test_unmarshal_error()
{
    struct
    {
        std::string_view name;
        std::string_view input;
        ewkb_errc expected;
    } test_cases[] = {
        {"empty",                   "",                                                       ewkb_errc::incomplete_data          },
        {"only_byte_order",         "01",                                                     ewkb_errc::incomplete_data          },
        {"truncated_type",          "010100",                                                 ewkb_errc::incomplete_data          },
        {"truncated_srid",          "0101000020e610",                                         ewkb_errc::incomplete_data          },
        {"truncated_point",         "0101000000000000000000f03f",                             ewkb_errc::incomplete_data          },
        {"byte_order_2",            "0201000000",                                             ewkb_errc::invalid_byte_order       },
        {"byte_order_ff",           "ff01000000",                                             ewkb_errc::invalid_byte_order       },
        {"type_0",                  "0100000000",                                             ewkb_errc::unsupported_geometry_type},
        {"type_8",                  "0108000000",                                             ewkb_errc::unsupported_geometry_type},
        {"type_17",                 "0111000000",                                             ewkb_errc::unsupported_geometry_type},
        {"z_flag",                  "0101000080000000000000f03f0000000000000040",             ewkb_errc::unsupported_dimensions   },
        {"m_flag",                  "0101000040000000000000f03f0000000000000040",             ewkb_errc::unsupported_dimensions   },
        {"iso_z",                   "01e9030000000000000000f03f0000000000000040",             ewkb_errc::unsupported_dimensions   },
        {"iso_zm",                  "01b90b0000",                                             ewkb_errc::unsupported_dimensions   },
        {"linestring_huge_count",   "0102000000ffffffff",                                     ewkb_errc::invalid_element_count    },
        {"linestring_short",        "010200000002000000000000000000f03f0000000000000040",     ewkb_errc::invalid_element_count    },
        {"polygon_huge_rings",      "0103000000ffffffff",                                     ewkb_errc::invalid_element_count    },
        {"collection_huge_count",   "0107000000ffffff7f",                                     ewkb_errc::invalid_element_count    },
        {"multi_point_linestring",
         "010400000001000000010200000001000000000000000000f03f0000000000000040",              ewkb_errc::unsupported_geometry_type},
        {"collection_bad_child",    "0107000000010000000109000000000000000000",               ewkb_errc::unsupported_geometry_type},
    };

    for (const auto& tc : test_cases)
    {
        pggeo::test::context_frame frame(tc.name);

        auto input = from_hex(tc.input);
        ewkb::unmarshal_result res;
        res.srid = 42;

        auto ec = ewkb::unmarshal(input, res);

        // The result is left untouched
        PGGEO_TEST_EQ(ec, error_code(tc.expected))
        PGGEO_TEST_EQ(res.srid, 42)
        PGGEO_TEST_EQ(res.bytes_consumed, 0u)
    }
}

//
// Round trip, with both byte orders
//
void test_roundtrip()
{
    polygon poly{
        {{0, 0}, {0, 10}, {10, 10}, {10, 0}, {0, 0}},
        {{2, 2}, {4, 2}, {4, 4}, {2, 2}}
    };

    struct
    {
        std::string_view name;
        geometry geom;
        std::int32_t srid;
    } test_cases[] = {
        {"point",                 point(-1.5, 1e10),                                             4326},
        {"point_no_srid",         point(0, 0),                                                   0   },
        {"linestring",            linestring{{1, 2}, {3, 4}, {5, 6}},                            3857},
        {"linestring_empty",      linestring{},                                                  4326},
        {"polygon",               poly,                                                          4326},
        {"multi_point",           multi_point{{1, 2}, {3, 4}},                                   4326},
        {"multi_linestring",      multi_linestring{{{1, 2}, {3, 4}}, {{5, 6}, {7, 8}}},          4326},
        {"multi_polygon",         multi_polygon{poly, polygon{}},                                4326},
        {"collection",            geometry_collection{point(1, 2), linestring{{1, 2}, {3, 4}}},  4326},
        {"collection_nested",     geometry_collection{geometry_collection{poly}, multi_point{}}, 4326},
        {"collection_empty",      geometry_collection{},                                         0   },
        {"negative_srid",         point(1, 2),                                                   -1  },
        {"max_srid",              point(1, 2),                      std::numeric_limits<std::int32_t>::max()},
    };

    for (auto order : {ewkb::byte_order::little, ewkb::byte_order::big})
    {
        for (const auto& tc : test_cases)
        {
            pggeo::test::context_frame frame(tc.name);

            std::vector<unsigned char> buf;
            auto ec = ewkb::marshal(tc.geom, tc.srid, order, buf);
            PGGEO_TEST_EQ(ec, error_code())
            PGGEO_TEST_EQ(buf.front(), static_cast<unsigned char>(order))

            ewkb::unmarshal_result res;
            ec = ewkb::unmarshal(buf, res);
            PGGEO_TEST_EQ(ec, error_code())
            PGGEO_TEST_GEOM_EQ(res.geom, tc.geom)
            PGGEO_TEST_EQ(res.srid, tc.srid)
            PGGEO_TEST_EQ(res.bytes_consumed, buf.size())
        }
    }
}

// Marshalling a concrete variant is the same as marshalling it wrapped in a geometry
void test_marshal_variant_overloads()
{
    multi_linestring value{{{1, 2}, {3, 4}}};
    std::vector<unsigned char> buf1, buf2;

    BOOST_TEST_EQ(ewkb::marshal(value, 4326, ewkb::byte_order::big, buf1), error_code());
    BOOST_TEST_EQ(ewkb::marshal(geometry(value), 4326, ewkb::byte_order::big, buf2), error_code());

    BOOST_TEST_ALL_EQ(buf1.begin(), buf1.end(), buf2.begin(), buf2.end());
}

}  // namespace

int main()
{
    test_marshal_postgis_point();
    test_marshal_plain_wkb_big_endian();
    test_marshal_linestring();
    test_marshal_empty_polygon();
    test_marshal_collection_srid();
    test_marshal_non_empty_buffer();
    test_marshal_invalid_byte_order();
    test_marshal_nesting();

    test_unmarshal_postgis_point();
    test_unmarshal_plain_wkb_big_endian();
    test_unmarshal_mixed_byte_order();
    test_unmarshal_trailing_bytes();
    test_unmarshal_empty_point();
    test_unmarshal_empty_polygon();
    test_unmarshal_nesting();
    test_unmarshal_error();

    test_roundtrip();
    test_marshal_variant_overloads();

    return boost::report_errors();
}
