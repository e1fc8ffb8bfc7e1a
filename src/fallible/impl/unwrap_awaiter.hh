#pragma once

#include <fallible/assert.hh>
#include <fallible/fwd.hh>
#include <fallible/impl/future_util.hh>
#include <fallible/source_location.hh>
#include <fallible/utility.hh>

#include <coroutine>
#include <exception>
#include <type_traits>

namespace fl::impl
{
/// Awaiter behind "co_await r" in try_block and maybe_block bodies.
/// Source is an fl::result or fl::option held by value for the duration of the co_await.
/// site is the location of the co_await, errors converted on failure record it.
///
///   Ok / Some:   await_ready() is true, the body continues with the moved payload
///   Err / None:  the promise records the failure and the body stays suspended forever,
///                the driver then returns the failure and destroys the frame
template <class Promise, class Source>
struct unwrap_awaiter
{
    using value_type = typename Source::value_type;

    Promise* promise;
    Source source;
    fl::source_location site = {};

    [[nodiscard]] bool await_ready() const noexcept
    {
        if constexpr (is_option<Source>)
            return source.is_some();
        else
            return source.is_ok();
    }

    void await_suspend(std::coroutine_handle<>) { promise->short_circuit(fl::move(source), site); }

    // by value, the awaiter dies at the end of the full expression
    value_type await_resume() { return fl::move(source).value(); }
};

/// Coroutine state shared by try_steps and maybe_steps.
/// Owns the frame: a body that failed at an unwrap is destroyed while suspended,
/// which runs the destructors of its locals.
template <class Promise>
struct steps_handle
{
    using handle_t = std::coroutine_handle<Promise>;

    steps_handle() = default;
    explicit steps_handle(handle_t h) : _handle(h) {}

    steps_handle(steps_handle&& rhs) noexcept : _handle(rhs._handle), _started(rhs._started) { rhs._handle = nullptr; }
    steps_handle& operator=(steps_handle&& rhs) noexcept
    {
        if (this != &rhs)
        {
            this->reset();
            _handle = rhs._handle;
            _started = rhs._started;
            rhs._handle = nullptr;
        }
        return *this;
    }

    steps_handle(steps_handle const&) = delete;
    steps_handle& operator=(steps_handle const&) = delete;

    ~steps_handle() { this->reset(); }

    /// Runs the body until it returns, fails at an unwrap or throws.
    /// An exception escaping the body is rethrown here.
    Promise& run()
    {
        FL_ASSERT(bool(_handle) && !_started, "steps can only be run once");

        _started = true;
        _handle.resume();

        auto& promise = _handle.promise();
        if (promise.exception != nullptr)
        {
            auto ex = promise.exception;
            std::rethrow_exception(ex);
        }

        return promise;
    }

private:
    void reset()
    {
        if (_handle)
            _handle.destroy();
        _handle = nullptr;
    }

    handle_t _handle = nullptr;
    bool _started = false;
};
} // namespace fl::impl
