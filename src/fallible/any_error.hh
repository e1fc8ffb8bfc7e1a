#pragma once

#include <fallible/fwd.hh>
#include <fallible/source_location.hh>
#include <fallible/to_debug_string.hh>

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

/// Type-erased error: a message, the site where it was raised and a chain of context notes.
/// Default error type of fl::result<T> and the error produced by fl::attempt's default mapper.
///
/// A default-constructed any_error is "empty" (no payload, no allocation).
/// Adding context to an empty error materializes a placeholder payload first.
///
/// Usage:
///   auto e = fl::any_error("file not found");
///   e.add_context("while loading config");
///   return fl::err(fl::move(e));
///
///   // any value with a string representation can become the message
///   auto code = fl::any_error(404);  // message "404"
struct fl::any_error
{
    struct context_note
    {
        std::string message;
        fl::source_location site;
    };

    // construction
public:
    any_error() = default;

    explicit any_error(std::string message, fl::source_location site = fl::source_location::current());
    explicit any_error(char const* message, fl::source_location site = fl::source_location::current())
      : any_error(std::string(message == nullptr ? "" : message), site)
    {
    }
    explicit any_error(std::string_view message, fl::source_location site = fl::source_location::current())
      : any_error(std::string(message), site)
    {
    }

    /// message is what()
    explicit any_error(std::exception const& ex, fl::source_location site = fl::source_location::current());

    /// message is the debug string of value, e.g. any_error(13) has message "13"
    template <class V>
        requires(!std::is_convertible_v<V const&, std::string_view> && !std::is_base_of_v<std::exception, V>
                 && !std::is_same_v<V, any_error>)
    explicit any_error(V const& value, fl::source_location site = fl::source_location::current())
      : any_error(fl::to_debug_string(value), site)
    {
    }

    any_error(any_error const& rhs);
    any_error& operator=(any_error const& rhs);
    any_error(any_error&& rhs) noexcept;
    any_error& operator=(any_error&& rhs) noexcept;
    ~any_error();

    // context
public:
    /// Appends a context note, newest notes are reported first
    any_error& add_context(std::string message, fl::source_location site = fl::source_location::current()) &;

    any_error& with_context(std::string message, fl::source_location site = fl::source_location::current()) &;
    [[nodiscard]] any_error with_context(std::string message, fl::source_location site = fl::source_location::current()) &&;

    // queries
public:
    [[nodiscard]] bool is_empty() const;

    /// "" if empty
    [[nodiscard]] std::string_view message() const;

    /// Where the error was created, or the current location if empty
    [[nodiscard]] fl::source_location site() const;

    [[nodiscard]] isize context_count() const;

    /// i == 0 is the most recently added note
    [[nodiscard]] context_note const& context(isize i) const;

    /// Multi-line report: message, site and all context notes
    [[nodiscard]] std::string to_string() const;

    /// Errors compare by message and context messages, sites are ignored
    [[nodiscard]] friend bool operator==(any_error const& lhs, any_error const& rhs);

    /// One-line form used inside "Err(...)": "error: <message>"
    [[nodiscard]] friend std::string to_string(any_error const& e);

private:
    struct payload;

    void impl_ensure_payload();

    std::unique_ptr<payload> _payload;
};

namespace fl
{
[[nodiscard]] std::string to_string(any_error const& e);

/// Default error mapper of fl::attempt: turns whatever was thrown into an any_error
///   - any_error is passed through unchanged
///   - std::exception becomes any_error(what())
///   - strings, integers and floating point values become any_error(<their string form>)
///   - anything else becomes any_error("unknown exception")
/// Never throws for a non-null e.
[[nodiscard]] any_error to_error(std::exception_ptr const& e);
} // namespace fl
