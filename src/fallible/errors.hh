#pragma once

#include <fallible/fwd.hh>
#include <fallible/macros.hh>

#include <stdexcept>
#include <string>

// Misuse errors: thrown when an unwrap-style accessor is called on the wrong variant.
// They are programming mistakes surfaced immediately and are never confused with the
// domain error E carried inside a result.

/// Thrown by option::expect and option::unwrap on None.
/// what() is the expect message verbatim, or "Unwrap called on None".
struct fl::option_error : std::logic_error
{
    explicit option_error(std::string const& message) : std::logic_error(message) {}
};

/// Thrown by result::unwrap, unwrap_err, expect and expect_err on the wrong variant.
/// what() embeds the debug string of the payload that was present instead.
struct fl::result_error : std::logic_error
{
    explicit result_error(std::string const& message) : std::logic_error(message) {}
};

namespace fl::impl
{
// out-of-line throw sites keep the (inlined) accessors small
[[noreturn]] FL_COLD_FUNC void throw_option_error(std::string const& message);
[[noreturn]] FL_COLD_FUNC void throw_result_error(std::string const& message);
} // namespace fl::impl
