#pragma once

#include <fallible/fwd.hh>
#include <fallible/impl/future_util.hh>
#include <fallible/impl/unwrap_awaiter.hh>
#include <fallible/option.hh>
#include <fallible/utility.hh>

#include <coroutine>
#include <exception>
#include <future>
#include <type_traits>

/// Coroutine type of an fl::maybe_block body, the option counterpart of fl::basic_try_steps.
/// "co_await o" continues with the payload of a Some and ends the block with None otherwise.
/// The body must co_return an option (or fl::none()).
/// Exceptions propagate out of the maybe_block unchanged.
template <class T, bool Async>
struct fl::basic_maybe_steps
{
    static constexpr bool is_async = Async;

    struct promise_type
    {
        // stays None when the body stops at a failed unwrap
        option<T> outcome;
        std::exception_ptr exception;

        basic_maybe_steps get_return_object()
        {
            return basic_maybe_steps(std::coroutine_handle<promise_type>::from_promise(*this));
        }

        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        void unhandled_exception() noexcept { exception = std::current_exception(); }

        template <class R>
        void return_value(R&& value)
        {
            static_assert(is_option<R> || std::is_same_v<std::remove_cvref_t<R>, none_t>,
                          "co_return in an fl::maybe_block body needs an fl::option or fl::none(), "
                          "bare values are not wrapped");
            outcome = option<T>(fl::forward<R>(value));
        }

        template <class U>
        impl::unwrap_awaiter<promise_type, option<U>> await_transform(option<U> source)
        {
            return {this, fl::move(source)};
        }

        template <class Future>
            requires impl::is_future<Future> && is_option<impl::future_value_t<Future>>
        auto await_transform(Future&& future)
        {
            static_assert(Async, "std::future can only be awaited in fl::async_maybe_steps bodies");

            using source_t = impl::future_value_t<Future>;
            return impl::unwrap_awaiter<promise_type, source_t>{this, source_t(future.get())};
        }

        template <class V>
            requires(!is_option<V> && !impl::is_future<V>)
        std::suspend_never await_transform(V&&)
        {
            static_assert(always_false_t<V>, "co_await in an fl::maybe_block body expects an fl::option");
            return {};
        }

        template <class U>
        void short_circuit(option<U>&&, fl::source_location)
        {
            // None carries nothing, outcome is already None
        }
    };

    // construction
public:
    basic_maybe_steps(basic_maybe_steps&&) noexcept = default;
    basic_maybe_steps& operator=(basic_maybe_steps&&) noexcept = default;

    [[nodiscard]] option<T> run() &&
    {
        auto& promise = _steps.run();
        return fl::move(promise.outcome);
    }

private:
    explicit basic_maybe_steps(std::coroutine_handle<promise_type> handle) : _steps(handle) {}

    impl::steps_handle<promise_type> _steps;
};

namespace fl
{
namespace impl
{
template <class S>
constexpr bool is_maybe_steps = false;
template <class T, bool Async>
constexpr bool is_maybe_steps<basic_maybe_steps<T, Async>> = true;
} // namespace impl

/// Runs body with early return on the first None
/// Returns option<T> for maybe_steps bodies, async_option<T> (deferred) for async_maybe_steps bodies.
///
/// Usage:
///   fl::option<int> port = fl::maybe_block([&]() -> fl::maybe_steps<int> {
///       auto section = co_await cfg.find("server");
///       auto text = co_await section.find("port");
///       co_return parse_int(text);
///   });
template <class Body>
    requires is_invocable<Body&>
[[nodiscard]] auto maybe_block(Body&& body)
{
    using steps_t = std::invoke_result_t<Body&>;
    static_assert(impl::is_maybe_steps<steps_t>, "maybe_block needs a body returning fl::maybe_steps<T> or "
                                                 "fl::async_maybe_steps<T>");

    if constexpr (!steps_t::is_async)
        return fl::invoke(body).run();
    else
        return std::async(std::launch::deferred,
                          [body = fl::forward<Body>(body)]() mutable { return fl::invoke(body).run(); });
}
} // namespace fl
