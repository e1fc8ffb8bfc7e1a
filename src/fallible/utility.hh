#pragma once

#include <fallible/fwd.hh>
#include <fallible/macros.hh>

#include <functional> // std::invoke
#include <type_traits>

// =========================================================================================================
// Utility functions and types shared by option, result and the combinators
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Callable utilities:
//   invoke(f, args...)          - uniform call syntax (functions, lambdas, member pointers)
//   is_invocable<F, Args...>    - true if invoke(f, args...) is well-formed
//   overloaded(f1, f2, ...)     - combine multiple callables into single overload set
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   is_option<T>, is_result<T>  - detect the library's sum types
//   forward_like_t<Self, T>     - T with the value category and constness of Self (for deducing this)
//
// Storage:
//   placement_new               - tag for header-light placement new
//   storage_for<T>              - uninitialized, properly aligned storage for one T
//
// Values:
//   unit                        - the empty value ("()")
//

namespace fl
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto r = fl::move(res).map(f);  // payload is moved into f
template <class T>
[[nodiscard]] FL_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] FL_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] FL_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Invokes f with args, supporting lambdas, function pointers and member pointers alike
/// Usage:
///   fl::some(person).map(&person::name);  // member object pointer
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args) noexcept(std::is_nothrow_invocable_v<F, Args...>)
{
    return std::invoke(fl::forward<F>(f), fl::forward<Args>(args)...);
}

/// True if fl::invoke(F, Args...) is well-formed
template <class F, class... Args>
constexpr bool is_invocable = std::is_invocable_v<F, Args...>;

/// Result type of fl::invoke(F, Args...) with references and cv stripped
template <class F, class... Args>
using invoke_value_t = std::remove_cvref_t<std::invoke_result_t<F, Args...>>;

/// Combines multiple callables into a single overload set via variadic inheritance
/// Usage:
///   auto f = fl::overloaded{
///       [](int x) { return x * 2; },
///       [](std::string const& s) { return int(s.size()); }
///   };
template <class... Fs>
struct overloaded : Fs...
{
    overloaded(Fs... fs) : Fs(fs)... {}
    using Fs::operator()...;
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct is_option_t : std::false_type
{
};
template <class T>
struct is_option_t<option<T>> : std::true_type
{
};

template <class T>
struct is_result_t : std::false_type
{
};
template <class T, class E>
struct is_result_t<result<T, E>> : std::true_type
{
};
} // namespace impl

/// True if T (ignoring cv and references) is some fl::option<U>
template <class T>
constexpr bool is_option = impl::is_option_t<std::remove_cvref_t<T>>::value;

/// True if T (ignoring cv and references) is some fl::result<U, E>
template <class T>
constexpr bool is_result = impl::is_result_t<std::remove_cvref_t<T>>::value;

/// T&, T const&, T&& or T const&& depending on Self
/// Used with deducing this to compute the type of a forwarded member:
///   template <class Self> void f(this Self&& self) { g(static_cast<Self&&>(self)._member); }
///   // the argument has type fl::forward_like_t<Self, decltype(_member)>
template <class Self, class T>
using forward_like_t = std::conditional_t<std::is_lvalue_reference_v<Self>,
                                          std::conditional_t<std::is_const_v<std::remove_reference_t<Self>>, T const&, T&>,
                                          std::conditional_t<std::is_const_v<std::remove_reference_t<Self>>, T const&&, T&&>>;

// =========================================================================================================
// Storage
// =========================================================================================================

/// Tag selecting fl's placement new overload (avoids pulling in <new>)
/// Usage:
///   new (fl::placement_new, &storage.value) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

/// Uninitialized storage with size and alignment of T
/// The member is only alive after an explicit placement new, the owner tracks that.
/// Stays trivially destructible (and copyable) when T is.
template <class T, bool = std::is_trivially_destructible_v<T>>
union storage_for
{
    storage_for() {}

    T value;
};

template <class T>
union storage_for<T, false>
{
    storage_for() {}
    ~storage_for() {}

    T value;
};

// =========================================================================================================
// Values
// =========================================================================================================

/// The single value of a type without information
/// Used as T for results of computations that return nothing
struct unit
{
    [[nodiscard]] friend constexpr bool operator==(unit, unit) noexcept { return true; }
};

} // namespace fl

[[nodiscard]] FL_FORCE_INLINE void* operator new(std::size_t, fl::placement_new_t, void* ptr) noexcept
{
    return ptr;
}

// matching delete, only called if a constructor in a placement new expression throws
FL_FORCE_INLINE void operator delete(void*, fl::placement_new_t, void*) noexcept {}
