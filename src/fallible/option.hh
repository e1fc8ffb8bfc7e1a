#pragma once

#include <fallible/any_error.hh>
#include <fallible/assert.hh>
#include <fallible/errors.hh>
#include <fallible/fwd.hh>
#include <fallible/to_debug_string.hh>
#include <fallible/utility.hh>

#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // std::pair, std::as_const

/// Sentinel type of the "no value" state of option.
/// There is exactly one instance, obtained via fl::none().
/// Deliberately lacks a default constructor so that option<T> o = {} stays unambiguous.
struct fl::none_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr none_t(_ctor_tag) {}

    [[nodiscard]] std::string to_string() const { return "None"; }
};

namespace fl
{
namespace impl
{
inline constexpr none_t none_instance = none_t{none_t::_ctor_tag::tag};
}

/// The shared None value
/// Usage:
///   fl::option<int> o = fl::none();
///   if (o == fl::none()) ...
[[nodiscard]] constexpr none_t const& none() noexcept
{
    return impl::none_instance;
}

/// An option that is produced by a (deferred) asynchronous computation
template <class T>
using async_option = std::future<option<T>>;
} // namespace fl

/// Sum type of either a value of type T (Some) or nothing (None).
///
/// Unlike std::optional, there is no operator* or operator->.
/// Values are read via unwrap/expect (throwing fl::option_error on None),
/// value() (asserting), or the combinators (map, and_then, match, ...).
///
/// All combinators take *this by deducing this:
///   - called on an lvalue, the payload is copied (the option stays usable)
///   - called on an rvalue, the payload is moved
///
///   auto name = user.map(&user_t::name);            // copies the user
///   auto name = fl::move(user).map(&user_t::name);  // moves the user
///
/// Trivially copyable when T is trivially copyable.
/// A moved-from option keeps its variant (and a moved-from payload).
template <class T>
struct fl::option
{
    static_assert(!std::is_reference_v<T>, "option of references is not supported, use option<T*>");
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>, "option payloads must not be cv-qualified");
    static_assert(!std::is_same_v<T, none_t>, "option<none_t> has no Some state");

    using value_type = T;

    // construction
public:
    /// Default option is None
    option() = default;

    /// None, usually written as fl::none()
    option(none_t const&) {}

    /// Some(value); conditionally explicit
    /// option<bool> never treats another option as its payload (explicit operator bool would allow that).
    template <class U = T>
        requires(std::is_constructible_v<T, U> && !std::is_same_v<std::remove_cvref_t<U>, option>
                 && !std::is_same_v<std::remove_cvref_t<U>, none_t> && !(std::is_same_v<T, bool> && is_option<U>))
    explicit(!std::is_convertible_v<U, T>) option(U&& value) : _has_value(true) // NOLINT
    {
        new (fl::placement_new, &_storage.value) T(fl::forward<U>(value));
    }

    /// Converting copy, e.g. option<long> from option<int>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_constructible_v<T, U const&>
                 && (std::is_same_v<T, bool> || !std::is_constructible_v<T, option<U> const&>))
    explicit(!std::is_convertible_v<U const&, T>) option(option<U> const& rhs) : _has_value(rhs.is_some())
    {
        if (_has_value)
            new (fl::placement_new, &_storage.value) T(rhs.value());
    }

    /// Converting move
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_constructible_v<T, U &&>
                 && (std::is_same_v<T, bool> || !std::is_constructible_v<T, option<U> &&>))
    explicit(!std::is_convertible_v<U &&, T>) option(option<U>&& rhs) : _has_value(rhs.is_some())
    {
        if (_has_value)
            new (fl::placement_new, &_storage.value) T(fl::move(rhs).value());
    }

    // trivial copy/move/destroy
public:
    option(option&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    option(option const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    option& operator=(option&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    option& operator=(option const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~option()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// rhs keeps its variant, a Some rhs holds a moved-from value afterwards
    option(option&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T> && std::is_move_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (fl::placement_new, &_storage.value) T(fl::move(rhs._storage.value));
    }

    option(option const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (fl::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Subobject self-move is safe: o = fl::move(o.value().child) works.
    option& operator=(option&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>
                                             && std::is_nothrow_move_assignable_v<T>)
        requires(!std::is_trivially_copyable_v<T> && std::is_move_constructible_v<T> && std::is_move_assignable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = fl::move(rhs._storage.value);
            else
                new (fl::placement_new, &_storage.value) T(fl::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    option& operator=(option const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (fl::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~option()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries
public:
    [[nodiscard]] bool is_some() const { return _has_value; }
    [[nodiscard]] bool is_none() const { return !_has_value; }

    [[nodiscard]] explicit operator bool() const { return _has_value; }

    /// false on None, pred is not invoked then
    template <class Pred>
    [[nodiscard]] bool is_some_and(Pred&& pred) const
    {
        return _has_value && bool(fl::invoke(fl::forward<Pred>(pred), _storage.value));
    }

    /// true on None, pred is not invoked then
    template <class Pred>
    [[nodiscard]] bool is_none_or(Pred&& pred) const
    {
        return !_has_value || bool(fl::invoke(fl::forward<Pred>(pred), _storage.value));
    }

    // access
public:
    /// Reference to the payload with the value category of the option.
    /// Precondition: is_some()
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        FL_ASSERT(self.is_some(), "accessed value of None");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Payload, or throws fl::option_error with what() == message on None.
    /// Lvalue options return a reference, rvalue options return the moved payload.
    template <class Self>
    [[nodiscard]] decltype(auto) expect(this Self&& self, std::string_view message)
    {
        if (!self._has_value)
            impl::throw_option_error(std::string(message));

        if constexpr (std::is_lvalue_reference_v<Self>)
            return (self._storage.value);
        else
            return T(fl::move(self._storage.value));
    }

    template <class Self>
    [[nodiscard]] decltype(auto) unwrap(this Self&& self)
    {
        return static_cast<Self&&>(self).expect("Unwrap called on None");
    }

    template <class Self, class U>
    [[nodiscard]] T unwrap_or(this Self&& self, U&& default_value)
    {
        if (self._has_value)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(fl::forward<U>(default_value));
    }

    /// fn() is only called on None
    template <class Self, class F>
    [[nodiscard]] T unwrap_or_else(this Self&& self, F&& fn)
    {
        if (self._has_value)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(fl::invoke(fl::forward<F>(fn)));
    }

    // transformation
public:
    /// Some(x) -> Some(fn(x)), None -> None without calling fn
    template <class Self, class F>
    [[nodiscard]] auto map(this Self&& self, F&& fn) -> option<invoke_value_t<F, forward_like_t<Self, T>>>
    {
        using U = invoke_value_t<F, forward_like_t<Self, T>>;
        static_assert(!std::is_void_v<U>, "map needs a function returning a value");

        if (!self._has_value)
            return option<U>();
        return option<U>(fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value));
    }

    template <class Self, class U, class F>
    [[nodiscard]] auto map_or(this Self&& self, U&& default_value, F&& fn) -> invoke_value_t<F, forward_like_t<Self, T>>
    {
        if (!self._has_value)
            return fl::forward<U>(default_value);
        return fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value);
    }

    /// default_fn() is only called on None
    template <class Self, class D, class F>
    [[nodiscard]] auto map_or_else(this Self&& self, D&& default_fn, F&& fn) -> invoke_value_t<F, forward_like_t<Self, T>>
    {
        if (!self._has_value)
            return fl::invoke(fl::forward<D>(default_fn));
        return fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value);
    }

    /// pred sees the payload as const, Some stays Some only if pred returns true
    template <class Self, class Pred>
    [[nodiscard]] option filter(this Self&& self, Pred&& pred)
    {
        if (self._has_value && bool(fl::invoke(fl::forward<Pred>(pred), std::as_const(self._storage.value))))
            return static_cast<Self&&>(self);
        return option();
    }

    /// Some(Some(x)) -> Some(x), Some(None) and None -> None
    template <class Self>
    [[nodiscard]] T flatten(this Self&& self)
        requires is_option<T>
    {
        if (!self._has_value)
            return T();
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Some((a, b)) if both are Some
    template <class Self, class U>
    [[nodiscard]] option<std::pair<T, U>> zip(this Self&& self, option<U> other)
    {
        if (!self._has_value || other.is_none())
            return {};
        return option<std::pair<T, U>>(std::pair<T, U>(static_cast<Self&&>(self)._storage.value, fl::move(other).value()));
    }

    // boolean combinators
    // (and, or and xor are alternative tokens in C++, hence the trailing underscore)
public:
    /// None if this is None, other otherwise
    template <class U>
    [[nodiscard]] option<U> and_(option<U> other) const
    {
        if (!_has_value)
            return {};
        return other;
    }

    /// Some(x) -> fn(x), None -> None without calling fn
    /// fn must return an option.
    template <class Self, class F>
    [[nodiscard]] auto and_then(this Self&& self, F&& fn) -> invoke_value_t<F, forward_like_t<Self, T>>
    {
        using R = invoke_value_t<F, forward_like_t<Self, T>>;
        static_assert(is_option<R>, "and_then needs a function returning an fl::option");

        if (!self._has_value)
            return R();
        return fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value);
    }

    /// this if Some, other otherwise
    template <class Self>
    [[nodiscard]] option or_(this Self&& self, option other)
    {
        if (self._has_value)
            return static_cast<Self&&>(self);
        return other;
    }

    /// this if Some, fn() otherwise (fn is only called on None)
    template <class Self, class F>
    [[nodiscard]] option or_else(this Self&& self, F&& fn)
    {
        static_assert(std::is_convertible_v<std::invoke_result_t<F>, option>, "or_else needs a function returning an "
                                                                               "fl::option of the same type");
        if (self._has_value)
            return static_cast<Self&&>(self);
        return fl::invoke(fl::forward<F>(fn));
    }

    /// Some if exactly one of this and other is Some
    template <class Self>
    [[nodiscard]] option xor_(this Self&& self, option other)
    {
        if (self._has_value && other.is_none())
            return static_cast<Self&&>(self);
        if (!self._has_value && other.is_some())
            return other;
        return option();
    }

    /// Invokes exactly one of the handlers: on_some(payload) or on_none()
    /// Both handlers are required, the returned value has their common type.
    template <class Self, class OnSome, class OnNone>
    decltype(auto) match(this Self&& self, OnSome&& on_some, OnNone&& on_none)
    {
        using R = std::common_type_t<std::invoke_result_t<OnSome, forward_like_t<Self, T>>, std::invoke_result_t<OnNone>>;

        if (self._has_value)
            return static_cast<R>(fl::invoke(fl::forward<OnSome>(on_some), static_cast<Self&&>(self)._storage.value));
        return static_cast<R>(fl::invoke(fl::forward<OnNone>(on_none)));
    }

    // conversion to result
    // (result is completed by result.hh, which is included at the end of this header)
public:
    /// Some(x) -> Ok(x), None -> Err(error)
    /// The error records the caller's site if E accepts one.
    template <class Self, class E>
    [[nodiscard]] result<T, std::decay_t<E>> ok_or(this Self&& self,
                                                   E&& error,
                                                   fl::source_location site = fl::source_location::current())
    {
        using R = result<T, std::decay_t<E>>;
        if (self._has_value)
            return R(ok_t<T>{static_cast<Self&&>(self)._storage.value});
        return R(err_t<std::decay_t<E>>{fl::forward<E>(error), site});
    }

    /// Some(x) -> Ok(x), None -> Err(fn()) (fn is only called on None)
    template <class Self, class F>
    [[nodiscard]] result<T, invoke_value_t<F>> ok_or_else(this Self&& self,
                                                          F&& fn,
                                                          fl::source_location site = fl::source_location::current())
    {
        using R = result<T, invoke_value_t<F>>;
        if (self._has_value)
            return R(ok_t<T>{static_cast<Self&&>(self)._storage.value});
        return R(err_t<invoke_value_t<F>>{fl::invoke(fl::forward<F>(fn)), site});
    }

    /// None becomes an any_error "No value"
    template <class Self>
    [[nodiscard]] result<T, any_error> into_result(this Self&& self,
                                                   fl::source_location site = fl::source_location::current())
    {
        if (self._has_value)
            return result<T, any_error>(ok_t<T>{static_cast<Self&&>(self)._storage.value});
        return result<T, any_error>(err_t<any_error>{any_error("No value", site), site});
    }

    // string conversion
public:
    /// "Some(<repr>)" or "None", never throws
    [[nodiscard]] std::string to_string() const
    {
        if (!_has_value)
            return "None";
        return "Some(" + fl::to_debug_string(_storage.value) + ")";
    }

    // comparison
public:
    /// Equal if both are None or both hold equal values
    [[nodiscard]] friend bool operator==(option const& lhs, option const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return bool(lhs._storage.value == rhs._storage.value);
        return true;
    }

    /// Equal if Some and the payload equals rhs
    [[nodiscard]] friend bool operator==(option const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && bool(lhs._storage.value == rhs);
    }

    [[nodiscard]] friend bool operator==(option const& lhs, none_t const&) { return !lhs._has_value; }

    /// Deleted unless T is bool, so option<int> cannot be compared against true/false by accident
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    fl::storage_for<T> _storage;
    bool _has_value = false;

    template <class U>
    friend struct option;
};

namespace fl
{
/// Some(value)
/// Usage:
///   auto o = fl::some(42);          // option<int>
///   auto s = fl::some("text"s);     // option<std::string>
template <class V>
[[nodiscard]] option<std::decay_t<V>> some(V&& value)
{
    return option<std::decay_t<V>>(fl::forward<V>(value));
}

/// None for an empty std::optional, Some(payload) otherwise
template <class T>
[[nodiscard]] option<T> from_nullable(std::optional<T> value)
{
    if (!value.has_value())
        return {};
    return option<T>(fl::move(*value));
}

namespace impl
{
template <class T>
struct is_std_optional_t : std::false_type
{
};
template <class T>
struct is_std_optional_t<std::optional<T>> : std::true_type
{
};

// raw pointers, smart pointers, std::function, ...
// string-likes compile against "== nullptr" but are never null
template <class P>
concept nullable_pointer_like
    = std::is_pointer_v<std::remove_cvref_t<P>> || std::is_member_pointer_v<std::remove_cvref_t<P>>
      || std::is_null_pointer_v<std::remove_cvref_t<P>>
      || (std::is_class_v<std::remove_cvref_t<P>> && !is_option<P> && !is_std_optional_t<std::remove_cvref_t<P>>::value
          && !std::is_convertible_v<std::remove_cvref_t<P> const&, std::string_view>
          && requires(std::remove_cvref_t<P> const& p) { bool(p == nullptr); });
} // namespace impl

/// None for a null pointer-like value (raw pointers, smart pointers, ...), Some(ptr) otherwise
template <impl::nullable_pointer_like P>
[[nodiscard]] option<std::decay_t<P>> from_nullable(P&& ptr)
{
    if (ptr == nullptr)
        return {};
    return option<std::decay_t<P>>(fl::forward<P>(ptr));
}

/// Some(value) if pred(value) holds, None otherwise
template <class V, class Pred>
[[nodiscard]] option<std::decay_t<V>> from_predicate(V&& value, Pred&& pred)
{
    if (!bool(fl::invoke(fl::forward<Pred>(pred), std::as_const(value))))
        return {};
    return option<std::decay_t<V>>(fl::forward<V>(value));
}

/// Capability of host types that know how to describe themselves as an option
/// Usage:
///   struct cache_entry { fl::option<std::string> into_option() const; };
///   auto o = fl::option_from(entry);
template <class C>
concept into_option_convertible = requires(C&& c) { fl::forward<C>(c).into_option(); }
                                  && is_option<decltype(std::declval<C>().into_option())>;

template <into_option_convertible C>
[[nodiscard]] auto option_from(C&& convertible)
{
    return fl::forward<C>(convertible).into_option();
}
} // namespace fl

// result is needed to complete option's conversion members
#include <fallible/result.hh>
