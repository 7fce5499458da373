//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_TEST_PRINTING_HPP
#define PGGEO_TEST_PRINTING_HPP

#include <cstdint>
#include <iosfwd>

namespace pggeo {

struct extended_error;
std::ostream& operator<<(std::ostream&, const extended_error&);

enum class format_code : std::int16_t;
std::ostream& operator<<(std::ostream&, format_code);

namespace types {

enum class geometry_kind : std::uint8_t;
std::ostream& operator<<(std::ostream&, geometry_kind);

class geometry;
std::ostream& operator<<(std::ostream&, const geometry&);

}  // namespace types

}  // namespace pggeo

#endif
