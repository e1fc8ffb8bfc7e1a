#pragma once

#include <fallible/fwd.hh>
#include <fallible/utility.hh>

#include <future>
#include <type_traits>

namespace fl::impl
{
template <class T>
struct future_traits
{
    static constexpr bool is_future = false;
};

template <class T>
struct future_traits<std::future<T>>
{
    static constexpr bool is_future = true;
    using value_type = T;
};

template <class T>
struct future_traits<std::shared_future<T>>
{
    static constexpr bool is_future = true;
    using value_type = T;
};

/// True for std::future<T> and std::shared_future<T> (ignoring cv and references)
template <class T>
constexpr bool is_future = future_traits<std::remove_cvref_t<T>>::is_future;

/// void becomes fl::unit, references and cv are stripped
template <class T>
using value_or_unit_t = std::conditional_t<std::is_void_v<T>, unit, std::remove_cvref_t<T>>;

/// Payload type of a std::future / std::shared_future, with void as fl::unit
template <class Future>
using future_value_t = value_or_unit_t<typename future_traits<std::remove_cvref_t<Future>>::value_type>;
} // namespace fl::impl
