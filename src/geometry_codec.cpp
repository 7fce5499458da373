//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "pggeo/client_errc.hpp"
#include "pggeo/extended_error.hpp"
#include "pggeo/format_code.hpp"
#include "pggeo/target_ref.hpp"
#include "pggeo/types/ewkb.hpp"
#include "pggeo/types/geometry.hpp"
#include "pggeo/types/geometry_codec.hpp"
#include "pggeo/value_ref.hpp"
#include "pggeo_internal/hex.hpp"

using namespace pggeo;
using namespace pggeo::types;
using boost::system::error_code;

namespace {

// Serializes the value as EWKB into a scratch buffer, so that
// nothing is appended to the output if encoding fails
extended_error marshal_value(value_ref value, std::vector<unsigned char>& to)
{
    if (!value.is_geometry())
        return {client_errc::operation_not_supported, {}};

    auto ec = detail::value_ref_access::marshal(value, ewkb::default_srid, ewkb::default_byte_order, to);
    if (ec)
    {
        extended_error res{ec, {}};
        res.diag.add_context("failed to encode geometry", ec);
        return res;
    }
    return {};
}

extended_error check_target(target_ref target)
{
    if (!target.is_pointer() || !target.is_geometry())
        return {client_errc::invalid_target, diagnostics("target must be a pointer to a geometry")};
    return {};
}

extended_error unmarshal_into(std::span<const unsigned char> src, target_ref target)
{
    ewkb::unmarshal_result res;
    auto ec = ewkb::unmarshal(src, res);
    if (ec)
        return {ec, {}};

    auto actual = res.geom.kind();
    if (!target.accepts_any() && target.kind() != actual)
    {
        std::string msg = "target type ";
        msg += target.type_name();
        msg += " doesn't match geometry type ";
        msg += type_name(actual);
        return {client_errc::incompatible_geometry_type, diagnostics(std::move(msg))};
    }

    detail::target_ref_access::assign(target, std::move(res.geom));
    return {};
}

extended_error unmarshal_value(std::span<const unsigned char> src, geometry& to)
{
    ewkb::unmarshal_result res;
    auto ec = ewkb::unmarshal(src, res);
    if (ec)
        return {ec, {}};
    to = std::move(res.geom);
    return {};
}

}  // namespace

extended_error geometry_binary_encode_plan::encode(value_ref value, std::vector<unsigned char>& buf) const
{
    std::vector<unsigned char> ewkb_buf;
    auto err = marshal_value(value, ewkb_buf);
    if (err.code)
        return err;
    buf.insert(buf.end(), ewkb_buf.begin(), ewkb_buf.end());
    return {};
}

extended_error geometry_text_encode_plan::encode(value_ref value, std::vector<unsigned char>& buf) const
{
    std::vector<unsigned char> ewkb_buf;
    auto err = marshal_value(value, ewkb_buf);
    if (err.code)
        return err;
    detail::hex_encode(ewkb_buf, buf);
    return {};
}

extended_error geometry_binary_scan_plan::scan(std::span<const unsigned char> src, target_ref target) const
{
    auto err = check_target(target);
    if (err.code)
        return err;

    // NULL leaves the target untouched
    if (src.empty())
        return {};

    return unmarshal_into(src, target);
}

extended_error geometry_text_scan_plan::scan(std::span<const unsigned char> src, target_ref target) const
{
    auto err = check_target(target);
    if (err.code)
        return err;

    if (src.empty())
        return {};

    std::vector<unsigned char> ewkb_buf;
    auto ec = detail::hex_decode(src, ewkb_buf);
    if (ec)
        return {ec, {}};

    return unmarshal_into(ewkb_buf, target);
}

bool geometry_codec::supports(format_code fmt) const
{
    return fmt == format_code::binary || fmt == format_code::text;
}

const encode_plan* geometry_codec::plan_encode(const type_map&, std::uint32_t, format_code fmt, value_ref)
    const
{
    static const geometry_binary_encode_plan binary_plan;
    static const geometry_text_encode_plan text_plan;

    switch (fmt)
    {
        case format_code::binary: return &binary_plan;
        case format_code::text: return &text_plan;
        default: return nullptr;
    }
}

const scan_plan* geometry_codec::plan_scan(const type_map&, std::uint32_t, format_code fmt, target_ref) const
{
    static const geometry_binary_scan_plan binary_plan;
    static const geometry_text_scan_plan text_plan;

    switch (fmt)
    {
        case format_code::binary: return &binary_plan;
        case format_code::text: return &text_plan;
        default: return nullptr;
    }
}

extended_error geometry_codec::decode_value(
    const type_map&,
    std::uint32_t,
    format_code fmt,
    std::span<const unsigned char> src,
    geometry& to
) const
{
    switch (fmt)
    {
        case format_code::text:
        {
            std::vector<unsigned char> ewkb_buf;
            auto ec = detail::hex_decode(src, ewkb_buf);
            if (ec)
                return {ec, {}};
            return unmarshal_value(ewkb_buf, to);
        }
        case format_code::binary: return unmarshal_value(src, to);
        default: return {client_errc::operation_not_supported, {}};
    }
}

extended_error geometry_codec::decode_database_sql_value(
    const type_map&,
    std::uint32_t,
    format_code,
    std::span<const unsigned char>,
    std::string&
) const
{
    return {client_errc::operation_not_supported, {}};
}
