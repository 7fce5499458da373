//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_SRC_HEX_HPP
#define PGGEO_SRC_HEX_HPP

#include <boost/system/error_code.hpp>

#include <span>
#include <vector>

namespace pggeo {
namespace detail {

// Encodes the given input as a lower-case hex string, appending it to the supplied buffer
void hex_encode(std::span<const unsigned char> input, std::vector<unsigned char>& to);

// Decodes the given input, interpreting it as a hex string. Either case is accepted.
// On error, output is left as it was.
[[nodiscard]] boost::system::error_code hex_decode(
    std::span<const unsigned char> input,
    std::vector<unsigned char>& output
);

}  // namespace detail
}  // namespace pggeo

#endif
