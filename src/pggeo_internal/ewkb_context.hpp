//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_SRC_EWKB_CONTEXT_HPP
#define PGGEO_SRC_EWKB_CONTEXT_HPP

#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <type_traits>
#include <vector>

#include "pggeo/types/ewkb.hpp"

namespace pggeo {
namespace ewkb {
namespace detail {

// Reads primitives from an (E)WKB buffer. The byte order may change
// from one nested geometry to the next, so every read takes it explicitly.
// The first error is sticky; reads after it return zeroes.
class parse_context
{
    const unsigned char* begin_;
    const unsigned char* first_;
    const unsigned char* last_;
    boost::system::error_code ec_;

public:
    parse_context(std::span<const unsigned char> range) noexcept
        : begin_(range.data()), first_(range.data()), last_(range.data() + range.size())
    {
    }

    std::size_t size() const { return static_cast<std::size_t>(last_ - first_); }

    std::size_t consumed() const { return static_cast<std::size_t>(first_ - begin_); }

    unsigned char get_byte()
    {
        if (size() < 1u)
            add_error(ewkb_errc::incomplete_data);
        return ec_ ? 0u : *first_++;
    }

    template <class UIntType>
    UIntType get_integral(byte_order order)
    {
        static_assert(std::is_unsigned<UIntType>::value, "WKB only uses unsigned types");
        if (size() < sizeof(UIntType))
            add_error(ewkb_errc::incomplete_data);
        if (ec_)
            return {};
        UIntType res = order == byte_order::big
                           ? boost::endian::
                                 endian_load<UIntType, sizeof(UIntType), boost::endian::order::big>(first_)
                           : boost::endian::
                                 endian_load<UIntType, sizeof(UIntType), boost::endian::order::little>(first_);
        first_ += sizeof(UIntType);
        return res;
    }

    double get_double(byte_order order) { return std::bit_cast<double>(get_integral<std::uint64_t>(order)); }

    // Reads a count of elements, each of which takes at least min_element_size bytes.
    // Counts that can't fit in the remaining input are an error
    std::uint32_t get_count(byte_order order, std::size_t min_element_size)
    {
        BOOST_ASSERT(min_element_size > 0u);
        auto res = get_integral<std::uint32_t>(order);
        if (!ec_ && res > size() / min_element_size)
        {
            add_error(ewkb_errc::invalid_element_count);
            return 0u;
        }
        return res;
    }

    void add_error(boost::system::error_code ec)
    {
        if (!ec_)
            ec_ = ec;
    }

    boost::system::error_code error() const { return ec_; }
};

// Appends primitives to an (E)WKB buffer in a fixed byte order
class serialization_context
{
    std::vector<unsigned char>& buffer_;
    byte_order order_;
    boost::system::error_code err_;

public:
    serialization_context(std::vector<unsigned char>& buff, byte_order order) noexcept
        : buffer_(buff), order_(order)
    {
    }

    byte_order order() const { return order_; }

    void add_error(boost::system::error_code ec)
    {
        if (!err_)
            err_ = ec;
    }

    boost::system::error_code error() const { return err_; }

    void add_byte(unsigned char byte) { buffer_.push_back(byte); }

    template <class UIntType>
    void add_integral(UIntType value)
    {
        unsigned char buff[sizeof(UIntType)];
        if (order_ == byte_order::big)
            boost::endian::endian_store<UIntType, sizeof(UIntType), boost::endian::order::big>(buff, value);
        else
            boost::endian::endian_store<UIntType, sizeof(UIntType), boost::endian::order::little>(buff, value);
        buffer_.insert(buffer_.end(), buff, buff + sizeof(UIntType));
    }

    void add_double(double value) { add_integral(std::bit_cast<std::uint64_t>(value)); }

    void add_count(std::size_t value)
    {
        if (value > (std::numeric_limits<std::uint32_t>::max)())
            add_error(ewkb_errc::value_too_big);
        else
            add_integral(static_cast<std::uint32_t>(value));
    }
};

}  // namespace detail
}  // namespace ewkb
}  // namespace pggeo

#endif
