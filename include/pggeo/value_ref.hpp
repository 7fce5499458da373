//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_VALUE_REF_HPP
#define PGGEO_VALUE_REF_HPP

#include <boost/system/error_code.hpp>

#include <concepts>
#include <cstdint>
#include <vector>

#include "pggeo/types/ewkb.hpp"
#include "pggeo/types/geometry_traits.hpp"

namespace pggeo {

namespace detail {

// Access private functions in value_ref
struct value_ref_access;

}  // namespace detail

// Type-erased reference to a value being sent to the server.
// Any type is accepted here; codecs decide whether they can encode it.
class value_ref
{
    using marshal_fn = boost::system::error_code (*)(
        const void* value,
        std::int32_t srid,
        ewkb::byte_order order,
        std::vector<unsigned char>& to
    );

    template <class T>
    static boost::system::error_code do_marshal(
        const void* value,
        std::int32_t srid,
        ewkb::byte_order order,
        std::vector<unsigned char>& to
    )
    {
        return ewkb::marshal(*static_cast<const T*>(value), srid, order, to);
    }

    template <class T>
    static marshal_fn make_marshal()
    {
        if constexpr (types::geometry_type<T>)
            return &do_marshal<T>;
        else
            return nullptr;
    }

    const void* value_;
    marshal_fn marshal_;

    friend struct detail::value_ref_access;

public:
    template <class T>
        requires(!std::same_as<T, value_ref>)
    value_ref(const T& value) noexcept : value_(&value), marshal_(make_marshal<T>())
    {
    }

    // Does this refer to a geometry or one of its variants?
    bool is_geometry() const noexcept { return marshal_ != nullptr; }
};

namespace detail {

// Library-facing API
struct value_ref_access
{
    static boost::system::error_code marshal(
        const value_ref& v,
        std::int32_t srid,
        ewkb::byte_order order,
        std::vector<unsigned char>& to
    )
    {
        return v.marshal_(v.value_, srid, order, to);
    }
};

}  // namespace detail

}  // namespace pggeo

#endif
