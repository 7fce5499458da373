//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_FORMAT_CODE_HPP
#define PGGEO_FORMAT_CODE_HPP

#include <cstdint>

namespace pggeo {

// Format codes, as sent in Bind and RowDescription messages.
// Values other than text and binary may reach a codec and must be rejected by it.
enum class format_code : std::int16_t
{
    text = 0,
    binary = 1,
};

inline const char* to_string(format_code value)
{
    switch (value)
    {
        case format_code::text: return "text";
        case format_code::binary: return "binary";
        default: return "<unknown format_code>";
    }
}

}  // namespace pggeo

#endif
