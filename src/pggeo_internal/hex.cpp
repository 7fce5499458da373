//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/algorithm/hex.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <iterator>
#include <span>
#include <string_view>
#include <vector>

#include "pggeo/client_errc.hpp"
#include "pggeo_internal/hex.hpp"

using namespace pggeo;

void pggeo::detail::hex_encode(std::span<const unsigned char> input, std::vector<unsigned char>& to)
{
    // Reserve size
    to.reserve(to.size() + input.size() * 2u);

    // Actually encode
    boost::algorithm::hex_lower(input.begin(), input.end(), std::back_inserter(to));
}

boost::system::error_code pggeo::detail::hex_decode(
    std::span<const unsigned char> input,
    std::vector<unsigned char>& output
)
{
    // Convert the input. unhex works on characters
    std::string_view input_str(reinterpret_cast<const char*>(input.data()), input.size());

    // Check that the size is valid
    if (input_str.size() % 2u != 0u)
        return client_errc::invalid_hex;

    // Decode into a scratch buffer, so output is untouched on failure
    std::vector<unsigned char> decoded;
    decoded.reserve(input_str.size() / 2u);
    try
    {
        boost::algorithm::unhex(input_str.begin(), input_str.end(), std::back_inserter(decoded));
    }
    catch (const boost::algorithm::hex_decode_error&)
    {
        return client_errc::invalid_hex;
    }

    output.insert(output.end(), decoded.begin(), decoded.end());
    return {};
}
