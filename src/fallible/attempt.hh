#pragma once

#include <fallible/any_error.hh>
#include <fallible/fwd.hh>
#include <fallible/impl/future_util.hh>
#include <fallible/result.hh>
#include <fallible/utility.hh>

#include <exception>
#include <future>
#include <type_traits>

// =========================================================================================================
// Bridging from exceptions to results
// =========================================================================================================
//
// attempt(fn)                 - calls fn once, Ok(return value) or Err(to_error(thrown exception))
// attempt(fn, mapper)         - same, Err(mapper(std::exception_ptr))
// with_attempt(fn[, mapper])  - wraps fn into a callable with attempt semantics
// from_throwable(fn, mapper)  - with_attempt with an explicit mapper
// from_promise(fut[, mapper]) - attempt on an already running std::future
//
// Whether the result is synchronous is decided by what fn returns:
//   - a std::future<U> or std::shared_future<U> yields an fl::async_result<U, E>
//     (a deferred future, the source future is waited on when the result is consumed)
//   - anything else yields an fl::result<U, E> immediately
// void becomes fl::unit. Exceptions never escape, neither from fn nor from the source future.
//
// Usage:
//   fl::result<int> r = fl::attempt([&] { return std::stoi(text); });
//
//   auto parse = fl::with_attempt([](std::string const& s) { return std::stoi(s); });
//   fl::result<int> a = parse("12");  // Ok(12)
//   fl::result<int> b = parse("ab");  // Err(any_error "stoi")
//
//   fl::async_result<std::string> page = fl::attempt([&] { return std::async(download, url); });
//   auto text = page.get().unwrap_or("");

namespace fl
{
namespace impl
{
template <class T, class E, class Future, class Mapper>
result<T, E> get_attempted(Future& future, Mapper& error_mapper)
{
    try
    {
        if constexpr (std::is_void_v<decltype(future.get())>)
        {
            future.get();
            return result<T, E>(in_place_value);
        }
        else
        {
            return result<T, E>(in_place_value, future.get());
        }
    }
    catch (...) // converted into Err
    {
        return result<T, E>(in_place_error, fl::invoke(error_mapper, std::current_exception()));
    }
}
} // namespace impl

/// Calls fn() and converts a thrown exception into Err(error_mapper(std::exception_ptr))
/// The error type of the result is the (decayed) return type of error_mapper.
template <class F, class Mapper>
    requires is_invocable<F&> && is_invocable<Mapper&, std::exception_ptr>
[[nodiscard]] auto attempt(F&& fn, Mapper&& error_mapper)
{
    using R = std::invoke_result_t<F&>;
    using E = invoke_value_t<Mapper&, std::exception_ptr>;

    if constexpr (impl::is_future<R>)
    {
        using T = impl::future_value_t<R>;

        try
        {
            auto future = fl::invoke(fn);
            return std::async(std::launch::deferred,
                              [future = fl::move(future), mapper = fl::forward<Mapper>(error_mapper)]() mutable
                              { return impl::get_attempted<T, E>(future, mapper); });
        }
        catch (...) // fn threw before producing a future, the error is delivered through the future
        {
            auto error = E(fl::invoke(error_mapper, std::current_exception()));
            return std::async(std::launch::deferred,
                              [error = fl::move(error)]() mutable { return result<T, E>(in_place_error, fl::move(error)); });
        }
    }
    else
    {
        using T = impl::value_or_unit_t<R>;

        try
        {
            if constexpr (std::is_void_v<R>)
            {
                fl::invoke(fn);
                return result<T, E>(in_place_value);
            }
            else
            {
                return result<T, E>(in_place_value, fl::invoke(fn));
            }
        }
        catch (...) // converted into Err
        {
            return result<T, E>(in_place_error, fl::invoke(error_mapper, std::current_exception()));
        }
    }
}

/// Same as attempt(fn, fl::to_error): errors are any_error
template <class F>
    requires is_invocable<F&>
[[nodiscard]] auto attempt(F&& fn)
{
    return fl::attempt(fl::forward<F>(fn), fl::to_error);
}

/// Callable that forwards its arguments to fn under attempt semantics
template <class F, class Mapper>
    requires is_invocable<Mapper&, std::exception_ptr>
[[nodiscard]] auto with_attempt(F&& fn, Mapper&& error_mapper)
{
    return [fn = fl::forward<F>(fn), mapper = fl::forward<Mapper>(error_mapper)]<class... Args>(Args&&... args) mutable
    {
        // fn is called inside attempt before this call returns, so forwarding references is safe
        return fl::attempt([&]() -> decltype(auto) { return fl::invoke(fn, fl::forward<Args>(args)...); }, mapper);
    };
}

template <class F>
[[nodiscard]] auto with_attempt(F&& fn)
{
    return fl::with_attempt(fl::forward<F>(fn), fl::to_error);
}

/// with_attempt with an explicit error mapper
template <class F, class Mapper>
    requires is_invocable<Mapper&, std::exception_ptr>
[[nodiscard]] auto from_throwable(F&& fn, Mapper&& error_mapper)
{
    return fl::with_attempt(fl::forward<F>(fn), fl::forward<Mapper>(error_mapper));
}

/// Async result of a future that is already running
/// Usage:
///   auto r = fl::from_promise(std::async(std::launch::async, compute));
template <class Future, class Mapper>
    requires impl::is_future<Future> && is_invocable<Mapper&, std::exception_ptr>
[[nodiscard]] auto from_promise(Future future, Mapper&& error_mapper)
{
    return fl::attempt([&future] { return fl::move(future); }, fl::forward<Mapper>(error_mapper));
}

template <class Future>
    requires impl::is_future<Future>
[[nodiscard]] auto from_promise(Future future)
{
    return fl::from_promise(fl::move(future), fl::to_error);
}
} // namespace fl
