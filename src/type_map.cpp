//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pggeo/client_errc.hpp"
#include "pggeo/codec.hpp"
#include "pggeo/extended_error.hpp"
#include "pggeo/format_code.hpp"
#include "pggeo/type_map.hpp"

using namespace pggeo;

namespace {

extended_error unknown_type_error(std::uint32_t oid)
{
    return {client_errc::unknown_type, diagnostics("no type registered for OID " + std::to_string(oid))};
}

extended_error format_unsupported_error(const pg_type& type, format_code fmt)
{
    std::string msg = "type ";
    msg += type.name;
    msg += " can't be used with format ";
    msg += to_string(fmt);
    return {client_errc::format_unsupported, diagnostics(std::move(msg))};
}

}  // namespace

void type_map::register_type(pg_type type)
{
    auto it = std::remove_if(types_.begin(), types_.end(), [&type](const pg_type& existing) {
        return existing.oid == type.oid || existing.name == type.name;
    });
    types_.erase(it, types_.end());
    types_.push_back(std::move(type));
}

const pg_type* type_map::type_for_oid(std::uint32_t oid) const noexcept
{
    auto it = std::find_if(types_.begin(), types_.end(), [oid](const pg_type& t) { return t.oid == oid; });
    return it == types_.end() ? nullptr : &*it;
}

const pg_type* type_map::type_for_name(std::string_view name) const noexcept
{
    auto it = std::find_if(types_.begin(), types_.end(), [name](const pg_type& t) { return t.name == name; });
    return it == types_.end() ? nullptr : &*it;
}

format_code type_map::preferred_format(std::uint32_t oid) const
{
    const auto* type = type_for_oid(oid);
    return type ? type->codec->preferred_format() : format_code::text;
}

const encode_plan* type_map::plan_encode(std::uint32_t oid, format_code fmt, value_ref value) const
{
    const auto* type = type_for_oid(oid);
    return type ? type->codec->plan_encode(*this, oid, fmt, value) : nullptr;
}

const scan_plan* type_map::plan_scan(std::uint32_t oid, format_code fmt, target_ref target) const
{
    const auto* type = type_for_oid(oid);
    return type ? type->codec->plan_scan(*this, oid, fmt, target) : nullptr;
}

extended_error type_map::encode(
    std::uint32_t oid,
    format_code fmt,
    value_ref value,
    std::vector<unsigned char>& buf
) const
{
    const auto* type = type_for_oid(oid);
    if (!type)
        return unknown_type_error(oid);
    const auto* plan = type->codec->plan_encode(*this, oid, fmt, value);
    if (!plan)
        return format_unsupported_error(*type, fmt);
    return plan->encode(value, buf);
}

extended_error type_map::scan(
    std::uint32_t oid,
    format_code fmt,
    std::optional<std::span<const unsigned char>> src,
    target_ref target
) const
{
    const auto* type = type_for_oid(oid);
    if (!type)
        return unknown_type_error(oid);
    const auto* plan = type->codec->plan_scan(*this, oid, fmt, target);
    if (!plan)
        return format_unsupported_error(*type, fmt);
    return plan->scan(src.value_or(std::span<const unsigned char>{}), target);
}

extended_error type_map::decode_value(
    std::uint32_t oid,
    format_code fmt,
    std::span<const unsigned char> src,
    types::geometry& to
) const
{
    const auto* type = type_for_oid(oid);
    if (!type)
        return unknown_type_error(oid);
    return type->codec->decode_value(*this, oid, fmt, src, to);
}
