#pragma once

#include <fallible/fwd.hh>
#include <fallible/to_string.hh>

#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for tuple_size

namespace fl
{
struct debug_string_config
{
    // not strict for now
    isize max_length = 100;
};

/// Marker emitted for values that have no textual representation
/// (callables, opaque handles, or types whose formatting threw).
inline constexpr std::string_view non_serializable_marker = "<non-serializable>";

// Converts a value to a developer-facing debug string.
// This is the "<repr>" inside "Some(<repr>)", "Ok(<repr>)" and "Err(<repr>)".
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..." with \" \\ \n \t escaped (never empty output)
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - Use to_string(v) if available (fl overloads or ADL)
//   - Use v.to_string() if available (this is how option and result nest)
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit <non-serializable>
//
// Never throws because of the value: if any step of the formatting throws,
// the whole output is replaced by <non-serializable>.
//
// No stability, completeness, or user-facing guarantees beyond the shapes above.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
template <class T>
std::string debug_string(T const& v, debug_string_config const& cfg);

inline void append_escaped_char(std::string& s, char c, char quote)
{
    if (c == quote)
    {
        s += '\\';
        s += c;
    }
    else if (c == '\0')
        s += "\\0";
    else if (c == '\n')
        s += "\\n";
    else if (c == '\r')
        s += "\\r";
    else if (c == '\t')
        s += "\\t";
    else if (c == '\\')
        s += "\\\\";
    else if ((c >= 0 && c < 32) || c == 127) // Other control characters
        s += std::format("\\x{:02X}", static_cast<unsigned char>(c));
    else
        s += c;
}

template <class T>
bool debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += impl::debug_string(v, cfg);

    return true;
}

template <class T, std::size_t... I>
void debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(impl::debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}

template <class T>
std::string debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (std::is_pointer_v<T> && std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>)
    {
        if (v == nullptr)
            return "nullptr";
        return impl::debug_string(std::string_view(v), cfg);
    }
    else if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        for (char c : std::string_view(v))
            impl::append_escaped_char(s, c, '\"');
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");
        impl::append_escaped_char(s, v, '\'');
        s += '\'';
        return s;
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!impl::debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        impl::debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        return std::string(non_serializable_marker);
    }
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    try
    {
        return impl::debug_string(v, cfg);
    }
    catch (...) // formatting failures of user types are reported as a marker, not propagated
    {
        return std::string(non_serializable_marker);
    }
}
} // namespace fl
