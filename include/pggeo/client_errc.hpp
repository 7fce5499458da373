//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_CLIENT_ERRC_HPP
#define PGGEO_CLIENT_ERRC_HPP

#include <boost/system/error_code.hpp>

namespace pggeo {

const boost::system::error_category& get_client_category();

enum class client_errc : int
{
    /// The codec does not implement the requested operation, or the value offered for
    /// encoding is not a geometry.
    operation_not_supported = 1,

    // The codec registered for the OID doesn't offer a plan for the requested format code
    format_unsupported,

    // No type has been registered for the OID
    unknown_type,

    // The scan destination is not a pointer to a geometry type
    invalid_target,

    // The decoded geometry is not the variant the destination expects.
    // Scan into a pggeo::types::geometry to accept any variant.
    incompatible_geometry_type,

    // Decoding hex failed because of malformed input
    invalid_hex,
};

/// Creates an \ref error_code from a \ref client_errc.
inline boost::system::error_code make_error_code(client_errc error)
{
    return boost::system::error_code(static_cast<int>(error), get_client_category());
}

}  // namespace pggeo

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::pggeo::client_errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
