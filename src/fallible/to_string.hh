#pragma once

#include <fallible/fwd.hh>

#include <string>
#include <string_view>

// Plain, non-quoting conversions used as the leaves of fl::to_debug_string.
// User types opt in by providing a to_string(T const&) findable by ADL or a to_string() member.

namespace fl
{
// in hex
[[nodiscard]] std::string to_string(void const* ptr);

// "nullptr"
[[nodiscard]] std::string to_string(std::nullptr_t);

// true/false
[[nodiscard]] std::string to_string(bool b);

// simply the char
[[nodiscard]] std::string to_string(char c);

// integer types
// note: does not use the sized versions because this style is _complete_ for users
[[nodiscard]] std::string to_string(signed char i);
[[nodiscard]] std::string to_string(unsigned char i);
[[nodiscard]] std::string to_string(signed short i);
[[nodiscard]] std::string to_string(unsigned short i);
[[nodiscard]] std::string to_string(signed int i);
[[nodiscard]] std::string to_string(unsigned int i);
[[nodiscard]] std::string to_string(signed long i);
[[nodiscard]] std::string to_string(unsigned long i);
[[nodiscard]] std::string to_string(signed long long i);
[[nodiscard]] std::string to_string(unsigned long long i);

// float/double, shortest round-trip representation
[[nodiscard]] std::string to_string(float f);
[[nodiscard]] std::string to_string(double f);

// no-op
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string s);
[[nodiscard]] std::string to_string(std::string_view s);

// "()"
[[nodiscard]] std::string to_string(unit);

} // namespace fl
