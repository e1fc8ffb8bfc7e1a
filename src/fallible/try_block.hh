#pragma once

#include <fallible/assert.hh>
#include <fallible/fwd.hh>
#include <fallible/impl/future_util.hh>
#include <fallible/impl/unwrap_awaiter.hh>
#include <fallible/option.hh>
#include <fallible/result.hh>
#include <fallible/utility.hh>

#include <coroutine>
#include <exception>
#include <future>
#include <type_traits>

/// Coroutine type of an fl::try_block body.
/// Inside the body, "co_await r" unwraps a result:
///   - Ok(x) continues with x (moved out of r)
///   - Err(e) ends the block immediately, the try_block returns Err(e)
/// The body must co_return a result (or fl::ok(...) / fl::err(...)), bare values are not wrapped.
///
/// Awaited results may have a different error type E2 as long as E can be built from it.
/// Async bodies (fl::async_try_steps) may additionally co_await a std::future of a result.
///
/// Exceptions thrown in the body are not converted, they propagate out of the try_block.
/// Wrap throwing calls with fl::attempt to turn them into results first.
template <class T, class E, bool Async>
struct fl::basic_try_steps
{
    static constexpr bool is_async = Async;

    struct promise_type
    {
        option<result<T, E>> outcome;
        std::exception_ptr exception;

        basic_try_steps get_return_object()
        {
            return basic_try_steps(std::coroutine_handle<promise_type>::from_promise(*this));
        }

        // the body only starts when the driver runs it
        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        void unhandled_exception() noexcept { exception = std::current_exception(); }

        template <class R>
        void return_value(R&& value)
        {
            static_assert(is_result<R> || impl::is_ok_t<std::remove_cvref_t<R>> || impl::is_err_t<std::remove_cvref_t<R>>,
                          "co_return in an fl::try_block body needs an fl::result, fl::ok(...) or fl::err(...), "
                          "bare values are not wrapped");
            outcome = option<result<T, E>>(result<T, E>(fl::forward<R>(value)));
        }

        // the default site argument is evaluated at the co_await
        template <class U, class E2>
        impl::unwrap_awaiter<promise_type, result<U, E2>> await_transform(result<U, E2> source,
                                                                          fl::source_location site = fl::source_location::current())
        {
            return {this, fl::move(source), site};
        }

        template <class Future>
            requires impl::is_future<Future> && is_result<impl::future_value_t<Future>>
        auto await_transform(Future&& future, fl::source_location site = fl::source_location::current())
        {
            static_assert(Async, "std::future can only be awaited in fl::async_try_steps bodies");

            using source_t = impl::future_value_t<Future>;
            return impl::unwrap_awaiter<promise_type, source_t>{this, source_t(future.get()), site};
        }

        template <class V>
            requires(!is_result<V> && !impl::is_future<V>)
        std::suspend_never await_transform(V&&)
        {
            static_assert(always_false_t<V>, "co_await in an fl::try_block body expects an fl::result");
            return {};
        }

        template <class U, class E2>
        void short_circuit(result<U, E2>&& failed, fl::source_location site)
        {
            if constexpr (std::is_same_v<E2, E>)
            {
                outcome = option<result<T, E>>(result<T, E>(in_place_error, fl::move(failed).error()));
            }
            else
            {
                static_assert(impl::error_constructible<E, E2&&>, "the error of an awaited result must convert to the "
                                                                  "error type of the try_block");
                outcome = option<result<T, E>>(result<T, E>(
                    in_place_error, impl::make_error<E>(fl::move(failed).error(), site)));
            }
        }
    };

    // construction
public:
    basic_try_steps(basic_try_steps&&) noexcept = default;
    basic_try_steps& operator=(basic_try_steps&&) noexcept = default;

    /// Runs the body to its co_return or its first failed unwrap
    /// Rethrows an exception that escaped the body.
    [[nodiscard]] result<T, E> run() &&
    {
        auto& promise = _steps.run();
        FL_ASSERT(promise.outcome.is_some(), "try_block body finished without co_return");
        return fl::move(promise.outcome).unwrap();
    }

private:
    explicit basic_try_steps(std::coroutine_handle<promise_type> handle) : _steps(handle) {}

    impl::steps_handle<promise_type> _steps;
};

namespace fl
{
namespace impl
{
template <class S>
constexpr bool is_try_steps = false;
template <class T, class E, bool Async>
constexpr bool is_try_steps<basic_try_steps<T, E, Async>> = true;
} // namespace impl

/// Runs body with early return on the first Err
/// Returns result<T, E> for try_steps bodies, async_result<T, E> (deferred) for async_try_steps bodies.
///
/// Usage:
///   fl::result<config> cfg = fl::try_block([&]() -> fl::try_steps<config> {
///       auto text = co_await read_file(path);       // Err ends the block here
///       auto doc = co_await parse_toml(text);
///       co_return fl::ok(config::from(doc));
///   });
template <class Body>
    requires is_invocable<Body&>
[[nodiscard]] auto try_block(Body&& body)
{
    using steps_t = std::invoke_result_t<Body&>;
    static_assert(impl::is_try_steps<steps_t>, "try_block needs a body returning fl::try_steps<T, E> or "
                                               "fl::async_try_steps<T, E>");

    if constexpr (!steps_t::is_async)
        return fl::invoke(body).run();
    else
        return std::async(std::launch::deferred,
                          [body = fl::forward<Body>(body)]() mutable { return fl::invoke(body).run(); });
}
} // namespace fl
