//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_EXTENDED_ERROR_HPP
#define PGGEO_EXTENDED_ERROR_HPP

#include <boost/system/error_code.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace pggeo {

class diagnostics
{
    std::string msg_;

public:
    diagnostics() noexcept = default;

    diagnostics(std::string msg) noexcept : msg_(std::move(msg)) {}

    std::string_view message() const { return msg_; }

    // Prepends "context: " to the current message, or to the error code's
    // message if there is no diagnostic text yet
    void add_context(std::string_view context, boost::system::error_code ec);

    friend bool operator==(const diagnostics& lhs, const diagnostics& rhs) noexcept = default;
};

struct extended_error
{
    boost::system::error_code code;
    diagnostics diag;

    friend bool operator==(const extended_error& lhs, const extended_error& rhs) noexcept = default;
};

// Throws boost::system::system_error if err contains an error
void throw_on_error(const extended_error& err);

}  // namespace pggeo

#endif
