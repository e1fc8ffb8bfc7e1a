#pragma once

#include <fallible/fwd.hh>
#include <fallible/macros.hh>
#include <fallible/source_location.hh>

#include <functional>
#include <string>

namespace fl::impl
{
// Precondition violations inside fallible (value() on None, error() on Ok, ...) are routed
// through a stack of handlers. The topmost handler sees the violation; without any handler
// the default one writes a report to std::cerr and the caller aborts.
//
// The stack is shared by all threads, so a handler installed on the main thread also sees
// violations inside futures that attempt() or from_promise() wait on.
//
//   {
//       auto guard = fl::impl::scoped_assertion_handler([](fl::impl::assertion_info const& info) {
//           throw my_test_failure{info.message};
//       });
//
//       auto v = maybe_empty.value(); // throws my_test_failure instead of aborting
//   }

struct assertion_info
{
    std::string expression;
    std::string message;
    fl::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

// handlers may throw to unwind to a recovery point
// if a handler returns normally, the failing assertion aborts
void push_assertion_handler(assertion_handler handler);

// no-op on an empty stack
void pop_assertion_handler();

[[nodiscard]] isize assertion_handler_count();

// pushes on construction, pops on destruction
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace fl::impl
