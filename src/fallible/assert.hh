#pragma once

// Included by every fallible header, so this only pulls in macros and source_location.
#include <fallible/macros.hh>
#include <fallible/source_location.hh>

// fallible reports three kinds of failure, and only the first one goes through this header:
//   - precondition violations, checked with FL_ASSERT:
//       option::value() on None, result::value() on Err, result::error() on Ok,
//       any_error::context(i) out of range, a try_block body without co_return
//   - misuse of the checked accessors, thrown as fl::option_error / fl::result_error:
//       unwrap(), expect(msg), unwrap_err(), expect_err(msg) on the wrong variant
//   - expected failures of the caller's own operations, carried as values in result<T, E>
//
// A failed FL_ASSERT hands an fl::impl::assertion_info to the topmost handler from
// assert-handler.hh (tests push one that throws), or prints it to std::cerr.
// Afterwards it breaks into an attached debugger and aborts.

// FL_ASSERT(cond, msg)
// Checked in FL_DEBUG and FL_RELWITHDEBINFO builds, and in FL_RELEASE builds that define
// FL_ENABLE_ASSERT_IN_RELEASE. Otherwise cond is not evaluated (but must still compile).
// msg must be a string literal.
//
//   FL_ASSERT(self.is_some(), "accessed value of None");
#define FL_ASSERT(cond, msg) FL_IMPL_ASSERT(cond, msg)

// FL_ASSERT_ALWAYS(cond, msg)
// Same as FL_ASSERT, but checked in every build configuration.
#define FL_ASSERT_ALWAYS(cond, msg) FL_IMPL_ASSERT_ALWAYS(cond, msg)

// Breaks if a debugger is attached, no-op otherwise
#define FL_DEBUG_BREAK() FL_IMPL_DEBUG_BREAK()

#define FL_BREAK_AND_ABORT() (FL_DEBUG_BREAK(), ::fl::impl::perform_abort())


namespace fl::impl
{
// reports the failure to the topmost handler (or std::cerr)
// the caller aborts afterwards, see FL_IMPL_ASSERT_ALWAYS
FL_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, fl::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace fl::impl

// the break must happen inside the macro so the debugger stops at the failing line

#ifdef FL_COMPILER_MSVC

#define FL_IMPL_DEBUG_BREAK() (::fl::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(FL_COMPILER_POSIX)

// 5 is SIGTRAP, declared here so that <csignal> stays out of every header
extern "C" int raise(int) noexcept;
#define FL_IMPL_DEBUG_BREAK() (::fl::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define FL_IMPL_DEBUG_BREAK() void(0)

#endif

#define FL_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::fl::impl::handle_assert_failure(#cond, msg, ::fl::source_location::current()); \
            FL_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if FL_ASSERT_ENABLED

#define FL_IMPL_ASSERT(cond, msg) FL_IMPL_ASSERT_ALWAYS(cond, msg)

#else

#define FL_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        FL_UNUSED(cond);          \
        FL_UNUSED(msg);           \
    } while (false)

#endif
