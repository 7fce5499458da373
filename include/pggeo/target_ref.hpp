//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGGEO_TARGET_REF_HPP
#define PGGEO_TARGET_REF_HPP

#include <concepts>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

#include "pggeo/types/geometry.hpp"
#include "pggeo/types/geometry_traits.hpp"

namespace pggeo {

namespace detail {

// Access private functions in target_ref
struct target_ref_access;

}  // namespace detail

// Type-erased reference to the place where a decoded value should be stored.
// Only pointers to a geometry variant (exact match required) or to
// types::geometry (any variant accepted) are valid destinations. Anything else can be
// wrapped, so that codecs can report the error.
class target_ref
{
    using assign_fn = void (*)(void* target, types::geometry&& value);

    template <class T>
    static void do_assign(void* target, types::geometry&& value)
    {
        if constexpr (std::is_same_v<T, types::geometry>)
            *static_cast<T*>(target) = std::move(value);
        else
            *static_cast<T*>(target) = std::move(*value.get_if<T>());
    }

    template <class T>
    static assign_fn make_assign()
    {
        if constexpr (types::geometry_type<T>)
            return &do_assign<T>;
        else
            return nullptr;
    }

    template <class T>
    static constexpr types::geometry_kind expected_kind() noexcept
    {
        if constexpr (types::geometry_variant_type<T>)
            return types::geometry_traits<T>::kind;
        else
            return {};
    }

    template <class T>
    static constexpr std::string_view pointer_type_name() noexcept
    {
        if constexpr (types::geometry_type<T>)
            return types::geometry_traits<T>::pointer_type_name;
        else
            return {};
    }

    void* target_{};
    assign_fn assign_{};
    bool is_pointer_{};
    bool accepts_any_{};
    types::geometry_kind kind_{};
    std::string_view type_name_;

    friend struct detail::target_ref_access;

public:
    // A pointer to the variable to write to
    template <class T>
    target_ref(T* target) noexcept
        : target_(target),
          assign_(make_assign<T>()),
          is_pointer_(target != nullptr),
          accepts_any_(std::is_same_v<T, types::geometry>),
          kind_(expected_kind<T>()),
          type_name_(pointer_type_name<T>())
    {
    }

    // Constants can't be written to. Never a valid destination
    template <class T>
    target_ref(const T* target) noexcept : is_pointer_(target != nullptr)
    {
    }

    // A value, rather than a pointer to it. Never a valid destination
    template <class T>
        requires(!std::same_as<T, target_ref> && !std::is_pointer_v<T>)
    target_ref(const T&) noexcept
    {
    }

    target_ref(std::nullptr_t) noexcept {}

    // Was this created from a non-null pointer?
    bool is_pointer() const noexcept { return is_pointer_; }

    // Does the pointed-to type hold geometries?
    bool is_geometry() const noexcept { return assign_ != nullptr; }

    // Does the pointed-to type accept any geometry variant?
    bool accepts_any() const noexcept { return accepts_any_; }

    // The variant expected by the destination. Only meaningful if !accepts_any()
    types::geometry_kind kind() const noexcept { return kind_; }

    // The pointer type, for diagnostics. Empty if !is_geometry()
    std::string_view type_name() const noexcept { return type_name_; }
};

namespace detail {

// Library-facing API
struct target_ref_access
{
    // Stores value into the target. The value must be of the kind
    // the target expects, or the target must accept any geometry.
    static void assign(const target_ref& t, types::geometry&& value) { t.assign_(t.target_, std::move(value)); }
};

}  // namespace detail

}  // namespace pggeo

#endif
