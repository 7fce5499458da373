//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

#include <string>
#include <string_view>
#include <utility>

#include "pggeo/client_errc.hpp"
#include "pggeo/extended_error.hpp"
#include "pggeo/types/ewkb.hpp"

using namespace pggeo;

namespace {

static const char* error_to_string(client_errc error)
{
    switch (error)
    {
        case client_errc::operation_not_supported: return "The operation is not supported";
        case client_errc::format_unsupported:
            return "The codec for this type doesn't support the requested format code";
        case client_errc::unknown_type: return "No type has been registered for the given OID";
        case client_errc::invalid_target: return "The scan target is not a pointer to a geometry";
        case client_errc::incompatible_geometry_type:
            return "The decoded geometry doesn't match the scan target type";
        case client_errc::invalid_hex: return "The input is not a valid hex string";
        default: return "<unknown pggeo client error>";
    }
}

static const char* error_to_string(ewkb_errc error)
{
    switch (error)
    {
        case ewkb_errc::incomplete_data: return "The EWKB input ended in the middle of a geometry";
        case ewkb_errc::invalid_byte_order: return "Invalid EWKB byte order marker";
        case ewkb_errc::unsupported_geometry_type: return "Unsupported EWKB geometry type";
        case ewkb_errc::unsupported_dimensions: return "Only 2D geometries are supported";
        case ewkb_errc::invalid_element_count:
            return "An EWKB element count exceeds the size of the input";
        case ewkb_errc::nesting_too_deep: return "Geometry collections are nested too deeply";
        case ewkb_errc::value_too_big: return "A geometry has too many elements to be represented in EWKB";
        default: return "<unknown pggeo ewkb error>";
    }
}

class client_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "pggeo.client"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<client_errc>(ev)); }
};

class ewkb_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "pggeo.ewkb"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<ewkb_errc>(ev)); }
};

static client_category g_clicat;
static ewkb_category g_ewkbcat;

}  // namespace

const boost::system::error_category& pggeo::get_client_category() { return g_clicat; }

const boost::system::error_category& pggeo::get_ewkb_category() { return g_ewkbcat; }

void diagnostics::add_context(std::string_view context, boost::system::error_code ec)
{
    std::string res(context);
    res += ": ";
    if (msg_.empty())
        res += ec.message();
    else
        res += msg_;
    msg_ = std::move(res);
}

void pggeo::throw_on_error(const extended_error& err)
{
    if (err.code)
        boost::throw_exception(boost::system::system_error(err.code, std::string(err.diag.message())));
}
