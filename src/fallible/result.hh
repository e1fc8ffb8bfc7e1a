#pragma once

#include <fallible/any_error.hh>
#include <fallible/assert.hh>
#include <fallible/errors.hh>
#include <fallible/fwd.hh>
#include <fallible/option.hh>
#include <fallible/source_location.hh>
#include <fallible/to_debug_string.hh>
#include <fallible/utility.hh>

#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // std::as_const

/// Success payload on its way into a result, see fl::ok(value)
template <class V>
struct fl::ok_t
{
    V value;
};

/// Error payload on its way into a result, see fl::err(error)
/// Remembers where it was created so that error types taking a source_location can record it.
template <class E>
struct fl::err_t
{
    E value;
    fl::source_location site;
};

namespace fl
{
/// Marks a value as success: fl::result<int> r = fl::ok(5);
template <class V>
[[nodiscard]] ok_t<std::decay_t<V>> ok(V&& value)
{
    return ok_t<std::decay_t<V>>{fl::forward<V>(value)};
}

/// Success without a value, for result<fl::unit, E>
[[nodiscard]] inline ok_t<unit> ok()
{
    return ok_t<unit>{unit{}};
}

/// Marks a value as error: fl::result<int> r = fl::err("file not found");
/// The call site is captured and passed to E's constructor if it takes one (e.g. any_error).
template <class V>
[[nodiscard]] err_t<std::decay_t<V>> err(V&& error, fl::source_location site = fl::source_location::current())
{
    return err_t<std::decay_t<V>>{fl::forward<V>(error), site};
}

/// A result that is produced by a (deferred) asynchronous computation
template <class T, class E = any_error>
using async_result = std::future<result<T, E>>;

namespace impl
{
struct in_place_value_t
{
    explicit in_place_value_t() = default;
};
struct in_place_error_t
{
    explicit in_place_error_t() = default;
};

/// E can be built from a V, optionally with the site where the error was raised
template <class E, class V>
constexpr bool error_constructible = std::is_constructible_v<E, V, fl::source_location> || std::is_constructible_v<E, V>;

template <class E, class V>
E make_error(V&& value, fl::source_location site)
{
    if constexpr (std::is_constructible_v<E, V, fl::source_location>)
        return E(fl::forward<V>(value), site);
    else
        return E(fl::forward<V>(value));
}

template <class T, class E, bool = std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>>
union result_storage
{
    result_storage() {}

    T value;
    E error;
};

template <class T, class E>
union result_storage<T, E, false>
{
    result_storage() {}
    ~result_storage() {}

    T value;
    E error;
};

template <class T>
constexpr bool is_ok_t = false;
template <class V>
constexpr bool is_ok_t<ok_t<V>> = true;

template <class T>
constexpr bool is_err_t = false;
template <class V>
constexpr bool is_err_t<err_t<V>> = true;

template <class T, class E>
constexpr bool result_is_trivial = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;
} // namespace impl

inline constexpr impl::in_place_value_t in_place_value{};
inline constexpr impl::in_place_error_t in_place_error{};
} // namespace fl

/// Sum type of either a success value T (Ok) or an error E (Err).
/// Used for operations that can fail in expected ways.
///
/// E defaults to fl::any_error, a type-erased error with message, site and context.
/// There is no third state: a default-constructed result is Err(E{}).
///
/// Construction:
///   fl::result<int> a = 5;                        // Ok(5)
///   fl::result<int> b = fl::ok(5);                // Ok(5)
///   fl::result<int> c = fl::err("no such file");  // Err(any_error "no such file")
///   auto d = fl::result<int, int>(fl::in_place_error, 42);
///
/// Like option, all combinators take *this by deducing this:
/// lvalue results copy their payload, rvalue results move it.
/// A callback for the other variant is never invoked and that payload is carried through untouched.
///
/// Trivially copyable when T and E are.
template <class T, class E>
struct fl::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result of references is not supported");
    static_assert(!std::is_void_v<T>, "use fl::result<fl::unit, E> for operations without a value");
    static_assert(!std::is_void_v<E>, "use fl::option<T> for operations without error information");

    using value_type = T;
    using error_type = E;

    // construction
public:
    /// Err(E{})
    result()
        requires std::is_default_constructible_v<E>
      : _is_ok(false)
    {
        new (fl::placement_new, &_storage.error) E();
    }

    /// Ok(value); conditionally explicit
    template <class U = T>
        requires(std::is_constructible_v<T, U> && !std::is_same_v<std::remove_cvref_t<U>, result>
                 && !std::is_same_v<std::remove_cvref_t<U>, impl::in_place_value_t>
                 && !std::is_same_v<std::remove_cvref_t<U>, impl::in_place_error_t>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) : _is_ok(true) // NOLINT
    {
        new (fl::placement_new, &_storage.value) T(fl::forward<U>(value));
    }

    template <class V>
        requires std::is_constructible_v<T, V &&>
    result(ok_t<V>&& ok) : _is_ok(true) // NOLINT
    {
        new (fl::placement_new, &_storage.value) T(fl::move(ok.value));
    }
    template <class V>
        requires std::is_constructible_v<T, V const&>
    result(ok_t<V> const& ok) : _is_ok(true) // NOLINT
    {
        new (fl::placement_new, &_storage.value) T(ok.value);
    }

    template <class V>
        requires impl::error_constructible<E, V &&>
    result(err_t<V>&& err) : _is_ok(false) // NOLINT
    {
        new (fl::placement_new, &_storage.error) E(impl::make_error<E>(fl::move(err.value), err.site));
    }
    template <class V>
        requires impl::error_constructible<E, V const&>
    result(err_t<V> const& err) : _is_ok(false) // NOLINT
    {
        new (fl::placement_new, &_storage.error) E(impl::make_error<E>(err.value, err.site));
    }

    /// Ok(T(args...))
    template <class... Args>
        requires std::is_constructible_v<T, Args...>
    explicit result(impl::in_place_value_t, Args&&... args) : _is_ok(true)
    {
        new (fl::placement_new, &_storage.value) T(fl::forward<Args>(args)...);
    }

    /// Err(E(args...))
    template <class... Args>
        requires std::is_constructible_v<E, Args...>
    explicit result(impl::in_place_error_t, Args&&... args) : _is_ok(false)
    {
        new (fl::placement_new, &_storage.error) E(fl::forward<Args>(args)...);
    }

    /// Converts payloads, e.g. result<int, std::string> to result<long> (any_error).
    /// Errors that accept a site record the location of the conversion.
    template <class T2, class E2>
        requires((!std::is_same_v<T2, T> || !std::is_same_v<E2, E>) && std::is_constructible_v<T, T2 const&>
                 && impl::error_constructible<E, E2 const&> && !std::is_constructible_v<T, result<T2, E2> const&>)
    explicit(!std::is_convertible_v<T2 const&, T>) result(result<T2, E2> const& rhs, // NOLINT
                                                          fl::source_location site = fl::source_location::current())
      : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (fl::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (fl::placement_new, &_storage.error) E(impl::make_error<E>(rhs._storage.error, site));
    }

    template <class T2, class E2>
        requires((!std::is_same_v<T2, T> || !std::is_same_v<E2, E>) && std::is_constructible_v<T, T2 &&>
                 && impl::error_constructible<E, E2 &&> && !std::is_constructible_v<T, result<T2, E2> &&>)
    explicit(!std::is_convertible_v<T2&&, T>) result(result<T2, E2>&& rhs, // NOLINT
                                                     fl::source_location site = fl::source_location::current())
      : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (fl::placement_new, &_storage.value) T(fl::move(rhs._storage.value));
        else
            new (fl::placement_new, &_storage.error) E(impl::make_error<E>(fl::move(rhs._storage.error), site));
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires impl::result_is_trivial<T, E>
    = default;
    result(result const&)
        requires impl::result_is_trivial<T, E>
    = default;
    result& operator=(result&&)
        requires impl::result_is_trivial<T, E>
    = default;
    result& operator=(result const&)
        requires impl::result_is_trivial<T, E>
    = default;

    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
    // the variant never changes on the source side, a moved-from result holds a moved-from payload
public:
    result(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        requires(!impl::result_is_trivial<T, E> && std::is_move_constructible_v<T> && std::is_move_constructible_v<E>)
      : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (fl::placement_new, &_storage.value) T(fl::move(rhs._storage.value));
        else
            new (fl::placement_new, &_storage.error) E(fl::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires(!impl::result_is_trivial<T, E> && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (fl::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (fl::placement_new, &_storage.error) E(rhs._storage.error);
    }

    /// Switching variants destroys the old payload after the new one is constructed into a temporary,
    /// so a throwing constructor leaves *this untouched.
    result& operator=(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_assignable_v<T>
                                             && std::is_nothrow_move_constructible_v<E>
                                             && std::is_nothrow_move_assignable_v<E>)
        requires(!impl::result_is_trivial<T, E> && std::is_move_constructible_v<T> && std::is_move_assignable_v<T>
                 && std::is_move_constructible_v<E> && std::is_move_assignable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_is_ok && rhs._is_ok)
            _storage.value = fl::move(rhs._storage.value);
        else if (!_is_ok && !rhs._is_ok)
            _storage.error = fl::move(rhs._storage.error);
        else if (rhs._is_ok)
            this->impl_emplace_value(fl::move(rhs._storage.value));
        else
            this->impl_emplace_error(fl::move(rhs._storage.error));

        return *this;
    }

    result& operator=(result const& rhs)
        requires(!impl::result_is_trivial<T, E> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>
                 && std::is_copy_constructible_v<E> && std::is_copy_assignable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_is_ok && rhs._is_ok)
            _storage.value = rhs._storage.value;
        else if (!_is_ok && !rhs._is_ok)
            _storage.error = rhs._storage.error;
        else if (rhs._is_ok)
            this->impl_emplace_value(rhs._storage.value);
        else
            this->impl_emplace_error(rhs._storage.error);

        return *this;
    }

    ~result()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
        this->impl_destroy();
    }

    // queries
public:
    [[nodiscard]] bool is_ok() const { return _is_ok; }
    [[nodiscard]] bool is_err() const { return !_is_ok; }

    /// false on Err, pred is not invoked then
    template <class Pred>
    [[nodiscard]] bool is_ok_and(Pred&& pred) const
    {
        return _is_ok && bool(fl::invoke(fl::forward<Pred>(pred), _storage.value));
    }

    /// false on Ok, pred is not invoked then
    template <class Pred>
    [[nodiscard]] bool is_err_and(Pred&& pred) const
    {
        return !_is_ok && bool(fl::invoke(fl::forward<Pred>(pred), _storage.error));
    }

    // access
public:
    /// Reference to the success value with the value category of the result.
    /// Precondition: is_ok()
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        FL_ASSERT(self._is_ok, "accessed value of an Err result");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Reference to the error with the value category of the result.
    /// Precondition: is_err()
    template <class Self>
    [[nodiscard]] auto&& error(this Self&& self)
    {
        FL_ASSERT(!self._is_ok, "accessed error of an Ok result");
        return static_cast<Self&&>(self)._storage.error;
    }

    /// Success value, or throws fl::result_error "Unwrapping value on Err(...)"
    /// Lvalue results return a reference, rvalue results return the moved value.
    template <class Self>
    [[nodiscard]] decltype(auto) unwrap(this Self&& self)
    {
        if (!self._is_ok)
            impl::throw_result_error("Unwrapping value on " + self.to_string());

        if constexpr (std::is_lvalue_reference_v<Self>)
            return (self._storage.value);
        else
            return T(fl::move(self._storage.value));
    }

    /// Error, or throws fl::result_error "Unwrapping error value on Ok(...)"
    template <class Self>
    [[nodiscard]] decltype(auto) unwrap_err(this Self&& self)
    {
        if (self._is_ok)
            impl::throw_result_error("Unwrapping error value on " + self.to_string());

        if constexpr (std::is_lvalue_reference_v<Self>)
            return (self._storage.error);
        else
            return E(fl::move(self._storage.error));
    }

    /// Like unwrap, the thrown fl::result_error reads "<message>: <error>"
    template <class Self>
    [[nodiscard]] decltype(auto) expect(this Self&& self, std::string_view message)
    {
        if (!self._is_ok)
            impl::throw_result_error(std::string(message) + ": " + fl::to_debug_string(self._storage.error));

        if constexpr (std::is_lvalue_reference_v<Self>)
            return (self._storage.value);
        else
            return T(fl::move(self._storage.value));
    }

    /// Like unwrap_err, the thrown fl::result_error reads "<message>: <value>"
    template <class Self>
    [[nodiscard]] decltype(auto) expect_err(this Self&& self, std::string_view message)
    {
        if (self._is_ok)
            impl::throw_result_error(std::string(message) + ": " + fl::to_debug_string(self._storage.value));

        if constexpr (std::is_lvalue_reference_v<Self>)
            return (self._storage.error);
        else
            return E(fl::move(self._storage.error));
    }

    template <class Self, class U>
    [[nodiscard]] T unwrap_or(this Self&& self, U&& default_value)
    {
        if (self._is_ok)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(fl::forward<U>(default_value));
    }

    /// fn(error) is only called on Err
    template <class Self, class F>
    [[nodiscard]] T unwrap_or_else(this Self&& self, F&& fn)
    {
        if (self._is_ok)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.error));
    }

    /// Same as unwrap_or
    template <class Self, class U>
    [[nodiscard]] T value_or(this Self&& self, U&& default_value)
    {
        return static_cast<Self&&>(self).unwrap_or(fl::forward<U>(default_value));
    }

    template <class Self, class U>
    [[nodiscard]] E error_or(this Self&& self, U&& default_error)
    {
        if (!self._is_ok)
            return static_cast<Self&&>(self)._storage.error;
        return static_cast<E>(fl::forward<U>(default_error));
    }

    // modifiers
public:
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        this->impl_emplace_value(fl::forward<Args>(args)...);
        return _storage.value;
    }

    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        this->impl_emplace_error(fl::forward<Args>(args)...);
        return _storage.error;
    }

    /// Adds a context note to an any_error, does nothing on Ok
    /// Usage:
    ///   return load(path).with_context("while loading the scene");
    result& with_context(std::string message, fl::source_location site = fl::source_location::current()) &
        requires std::is_same_v<E, any_error>
    {
        if (!_is_ok)
            _storage.error.add_context(fl::move(message), site);
        return *this;
    }
    [[nodiscard]] result with_context(std::string message, fl::source_location site = fl::source_location::current()) &&
        requires std::is_same_v<E, any_error>
    {
        if (!_is_ok)
            _storage.error.add_context(fl::move(message), site);
        return fl::move(*this);
    }

    /// Like with_context, but make_message() is only called on Err
    template <class F>
    result& with_context_lazy(F&& make_message, fl::source_location site = fl::source_location::current()) &
        requires std::is_same_v<E, any_error>
    {
        if (!_is_ok)
            _storage.error.add_context(std::string(fl::invoke(fl::forward<F>(make_message))), site);
        return *this;
    }
    template <class F>
    [[nodiscard]] result with_context_lazy(F&& make_message, fl::source_location site = fl::source_location::current()) &&
        requires std::is_same_v<E, any_error>
    {
        if (!_is_ok)
            _storage.error.add_context(std::string(fl::invoke(fl::forward<F>(make_message))), site);
        return fl::move(*this);
    }

    // projection to option
public:
    /// Some(value) on Ok, None on Err. No filtering of null-like values.
    template <class Self>
    [[nodiscard]] option<T> ok(this Self&& self)
    {
        if (!self._is_ok)
            return {};
        return option<T>(static_cast<Self&&>(self)._storage.value);
    }

    /// Some(error) on Err, None on Ok
    template <class Self>
    [[nodiscard]] option<E> err(this Self&& self)
    {
        if (self._is_ok)
            return {};
        return option<E>(static_cast<Self&&>(self)._storage.error);
    }

    /// Same as ok(), satisfies fl::into_option_convertible
    template <class Self>
    [[nodiscard]] option<T> into_option(this Self&& self)
    {
        return static_cast<Self&&>(self).ok();
    }

    /// Swaps the nesting of result and option:
    ///   Ok(Some(x)) -> Some(Ok(x)),  Ok(None) -> None,  Err(e) -> Some(Err(e))
    /// The same holds for a std::optional payload.
    /// For a pointer-like payload (raw or smart pointer), Ok(nullptr) -> None and Ok(p) -> Some(Ok(p)).
    /// Any other payload is never "null", even 0, false or "": the result is Some(*this).
    template <class Self>
    [[nodiscard]] auto transpose(this Self&& self)
    {
        if constexpr (is_option<T> || impl::is_std_optional_t<T>::value)
        {
            using U = typename T::value_type;
            using R = option<result<U, E>>;

            if (!self._is_ok)
                return R(result<U, E>(in_place_error, static_cast<Self&&>(self)._storage.error));
            if (!bool(self._storage.value))
                return R();
            return R(result<U, E>(in_place_value, static_cast<Self&&>(self)._storage.value.value()));
        }
        else
        {
            using R = option<result>;

            if constexpr (impl::nullable_pointer_like<T>)
                if (self._is_ok && self._storage.value == nullptr)
                    return R();

            return R(static_cast<Self&&>(self));
        }
    }

    // transformation
public:
    /// Ok(x) -> Ok(fn(x)), Err(e) -> Err(e) without calling fn
    template <class Self, class F>
    [[nodiscard]] auto map(this Self&& self, F&& fn) -> result<invoke_value_t<F, forward_like_t<Self, T>>, E>
    {
        using U = invoke_value_t<F, forward_like_t<Self, T>>;
        static_assert(!std::is_void_v<U>, "map needs a function returning a value, use inspect for side effects");

        if (!self._is_ok)
            return result<U, E>(in_place_error, static_cast<Self&&>(self)._storage.error);
        return result<U, E>(in_place_value, fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value));
    }

    /// Err(e) -> Err(fn(e)), Ok(x) -> Ok(x) without calling fn
    template <class Self, class F>
    [[nodiscard]] auto map_err(this Self&& self, F&& fn) -> result<T, invoke_value_t<F, forward_like_t<Self, E>>>
    {
        using E2 = invoke_value_t<F, forward_like_t<Self, E>>;
        static_assert(!std::is_void_v<E2>, "map_err needs a function returning a value, use inspect_err for side effects");

        if (self._is_ok)
            return result<T, E2>(in_place_value, static_cast<Self&&>(self)._storage.value);
        return result<T, E2>(in_place_error, fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.error));
    }

    template <class Self, class U, class F>
    [[nodiscard]] auto map_or(this Self&& self, U&& default_value, F&& fn) -> invoke_value_t<F, forward_like_t<Self, T>>
    {
        if (!self._is_ok)
            return fl::forward<U>(default_value);
        return fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value);
    }

    /// Ok(x) -> fn(x), Err(e) -> default_fn(e)
    template <class Self, class D, class F>
    [[nodiscard]] auto map_or_else(this Self&& self, D&& default_fn, F&& fn) -> invoke_value_t<F, forward_like_t<Self, T>>
    {
        if (!self._is_ok)
            return fl::invoke(fl::forward<D>(default_fn), static_cast<Self&&>(self)._storage.error);
        return fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value);
    }

    /// Calls fn(value) on Ok and passes the result on
    template <class Self, class F>
    [[nodiscard]] result inspect(this Self&& self, F&& fn)
    {
        if (self._is_ok)
            fl::invoke(fl::forward<F>(fn), std::as_const(self._storage.value));
        return static_cast<Self&&>(self);
    }

    /// Calls fn(error) on Err and passes the result on
    template <class Self, class F>
    [[nodiscard]] result inspect_err(this Self&& self, F&& fn)
    {
        if (!self._is_ok)
            fl::invoke(fl::forward<F>(fn), std::as_const(self._storage.error));
        return static_cast<Self&&>(self);
    }

    /// Ok(Ok(x)) -> Ok(x), Ok(Err(e)) -> Err(e), Err(e) -> Err(e)
    template <class Self>
    [[nodiscard]] T flatten(this Self&& self)
        requires(is_result<T> && std::is_constructible_v<T, impl::in_place_error_t, forward_like_t<Self, E>>)
    {
        if (!self._is_ok)
            return T(in_place_error, static_cast<Self&&>(self)._storage.error);
        return static_cast<Self&&>(self)._storage.value;
    }

    // boolean combinators
    // (and, or and xor are alternative tokens in C++, hence the trailing underscore)
public:
    /// Err(e) if this is Err, other otherwise
    template <class Self, class U>
    [[nodiscard]] result<U, E> and_(this Self&& self, result<U, E> other)
    {
        if (!self._is_ok)
            return result<U, E>(in_place_error, static_cast<Self&&>(self)._storage.error);
        return other;
    }

    /// Ok(x) -> fn(x), Err(e) -> Err(e) without calling fn
    /// fn must return a result whose error type can hold E.
    /// An error converted to another type (e.g. std::string to any_error) records the caller's site.
    template <class Self, class F>
    [[nodiscard]] auto and_then(this Self&& self, F&& fn, fl::source_location site = fl::source_location::current())
        -> invoke_value_t<F, forward_like_t<Self, T>>
    {
        using R = invoke_value_t<F, forward_like_t<Self, T>>;
        static_assert(is_result<R>, "and_then needs a function returning an fl::result");
        using E2 = typename R::error_type;

        if (!self._is_ok)
        {
            if constexpr (std::is_same_v<E2, E>)
                return R(in_place_error, static_cast<Self&&>(self)._storage.error);
            else
                return R(in_place_error, impl::make_error<E2>(static_cast<Self&&>(self)._storage.error, site));
        }
        return fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.value);
    }

    /// Ok(x) if this is Ok, other otherwise
    template <class Self, class E2>
    [[nodiscard]] result<T, E2> or_(this Self&& self, result<T, E2> other)
    {
        if (self._is_ok)
            return result<T, E2>(in_place_value, static_cast<Self&&>(self)._storage.value);
        return other;
    }

    /// Ok(x) -> Ok(x) without calling fn, Err(e) -> fn(e)
    /// fn must return a result whose value type can hold T.
    template <class Self, class F>
    [[nodiscard]] auto or_else(this Self&& self, F&& fn) -> invoke_value_t<F, forward_like_t<Self, E>>
    {
        using R = invoke_value_t<F, forward_like_t<Self, E>>;
        static_assert(is_result<R>, "or_else needs a function returning an fl::result");

        if (self._is_ok)
            return R(in_place_value, static_cast<Self&&>(self)._storage.value);
        return fl::invoke(fl::forward<F>(fn), static_cast<Self&&>(self)._storage.error);
    }

    /// Invokes exactly one of the handlers: on_ok(value) or on_err(error)
    /// Both handlers are required, the returned value has their common type.
    template <class Self, class OnOk, class OnErr>
    decltype(auto) match(this Self&& self, OnOk&& on_ok, OnErr&& on_err)
    {
        using R = std::common_type_t<std::invoke_result_t<OnOk, forward_like_t<Self, T>>,
                                     std::invoke_result_t<OnErr, forward_like_t<Self, E>>>;

        if (self._is_ok)
            return static_cast<R>(fl::invoke(fl::forward<OnOk>(on_ok), static_cast<Self&&>(self)._storage.value));
        return static_cast<R>(fl::invoke(fl::forward<OnErr>(on_err), static_cast<Self&&>(self)._storage.error));
    }

    // string conversion
public:
    /// "Ok(<repr>)" or "Err(<repr>)", never throws
    /// Usage:
    ///   fl::result<int, std::string>(42).to_string()        // Ok(42)
    ///   fl::result<int, std::string>(fl::err("x")).to_string()  // Err("x")
    [[nodiscard]] std::string to_string() const
    {
        if (_is_ok)
            return "Ok(" + fl::to_debug_string(_storage.value) + ")";
        return "Err(" + fl::to_debug_string(_storage.error) + ")";
    }

    // comparison
public:
    /// Equal if both hold the same variant with equal payloads
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._is_ok != rhs._is_ok)
            return false;
        if (lhs._is_ok)
            return bool(lhs._storage.value == rhs._storage.value);
        return bool(lhs._storage.error == rhs._storage.error);
    }

    // helper
private:
    void impl_destroy()
    {
        if (_is_ok)
            _storage.value.~T();
        else
            _storage.error.~E();
    }

    template <class... Args>
    void impl_emplace_value(Args&&... args)
    {
        if constexpr (std::is_nothrow_constructible_v<T, Args...>)
        {
            this->impl_destroy();
            new (fl::placement_new, &_storage.value) T(fl::forward<Args>(args)...);
        }
        else
        {
            T tmp(fl::forward<Args>(args)...);
            this->impl_destroy();
            new (fl::placement_new, &_storage.value) T(fl::move(tmp));
        }
        _is_ok = true;
    }

    template <class... Args>
    void impl_emplace_error(Args&&... args)
    {
        if constexpr (std::is_nothrow_constructible_v<E, Args...>)
        {
            this->impl_destroy();
            new (fl::placement_new, &_storage.error) E(fl::forward<Args>(args)...);
        }
        else
        {
            E tmp(fl::forward<Args>(args)...);
            this->impl_destroy();
            new (fl::placement_new, &_storage.error) E(fl::move(tmp));
        }
        _is_ok = false;
    }

    // members
private:
    impl::result_storage<T, E> _storage;
    bool _is_ok;

    template <class, class>
    friend struct result;
};

namespace fl
{
/// Capability of host types that know how to describe themselves as a result,
/// typically error types or domain responses:
///   struct http_response {
///       fl::result<std::string, http_error> into_result() const;
///   };
///   auto r = fl::result_from(response);
template <class C>
concept into_result_convertible = requires(C&& c) { fl::forward<C>(c).into_result(); }
                                  && is_result<decltype(std::declval<C>().into_result())>;

template <into_result_convertible C>
[[nodiscard]] auto result_from(C&& convertible)
{
    return fl::forward<C>(convertible).into_result();
}
} // namespace fl
