#include "any_error.hh"

#include <fallible/assert.hh>
#include <fallible/to_string.hh>
#include <fallible/utility.hh>

#include <vector>


struct fl::any_error::payload
{
    std::string message;
    fl::source_location site;
    std::vector<context_note> notes; // oldest first

    payload(std::string msg, fl::source_location s) : message(fl::move(msg)), site(s) {}
};

fl::any_error::any_error(std::string message, fl::source_location site)
  : _payload(std::make_unique<payload>(fl::move(message), site))
{
}

fl::any_error::any_error(std::exception const& ex, fl::source_location site) : any_error(std::string(ex.what()), site)
{
}

fl::any_error::any_error(any_error const& rhs)
{
    if (rhs._payload)
        _payload = std::make_unique<payload>(*rhs._payload);
}

fl::any_error& fl::any_error::operator=(any_error const& rhs)
{
    if (this != &rhs)
        _payload = rhs._payload ? std::make_unique<payload>(*rhs._payload) : nullptr;
    return *this;
}

// must be added here because payload is only fwd declared in any_error
fl::any_error::any_error(any_error&& rhs) noexcept = default;
fl::any_error& fl::any_error::operator=(any_error&& rhs) noexcept = default;
fl::any_error::~any_error() = default;

void fl::any_error::impl_ensure_payload()
{
    if (_payload)
        return;

    _payload = std::make_unique<payload>("<empty fl::any_error>", fl::source_location::current());
}

fl::any_error& fl::any_error::add_context(std::string message, fl::source_location site) &
{
    this->impl_ensure_payload();
    _payload->notes.push_back(context_note{fl::move(message), site});
    return *this;
}

fl::any_error& fl::any_error::with_context(std::string message, fl::source_location site) &
{
    return add_context(fl::move(message), site);
}

fl::any_error fl::any_error::with_context(std::string message, fl::source_location site) &&
{
    add_context(fl::move(message), site);
    return fl::move(*this);
}

bool fl::any_error::is_empty() const
{
    return _payload == nullptr;
}

std::string_view fl::any_error::message() const
{
    return _payload ? std::string_view(_payload->message) : std::string_view();
}

fl::source_location fl::any_error::site() const
{
    return _payload ? _payload->site : fl::source_location::current();
}

fl::isize fl::any_error::context_count() const
{
    return _payload ? isize(_payload->notes.size()) : 0;
}

fl::any_error::context_note const& fl::any_error::context(isize i) const
{
    FL_ASSERT(0 <= i && i < context_count(), "context index out of bounds");
    auto const& notes = _payload->notes;
    return notes[notes.size() - 1 - size_t(i)];
}

std::string fl::any_error::to_string() const
{
    if (!_payload)
        return "error: <empty fl::any_error>\n";

    std::string result;

    result += "error: ";
    result += _payload->message;
    result += "\n";

    auto const s = _payload->site;
    result += "  at ";
    result += s.file_name();
    result += ":";
    result += fl::to_string(s.line());
    result += " - ";
    result += s.function_name();
    result += "\n";

    for (auto it = _payload->notes.rbegin(); it != _payload->notes.rend(); ++it)
    {
        result += "  context: ";
        result += it->message;
        result += " (at ";
        result += it->site.file_name();
        result += ":";
        result += fl::to_string(it->site.line());
        result += ")\n";
    }

    return result;
}

namespace fl
{
bool operator==(any_error const& lhs, any_error const& rhs)
{
    if (lhs.context_count() != rhs.context_count() || lhs.message() != rhs.message())
        return false;

    for (isize i = 0; i < lhs.context_count(); ++i)
        if (lhs.context(i).message != rhs.context(i).message)
            return false;

    return true;
}

std::string to_string(any_error const& e)
{
    if (e.is_empty())
        return "error: <empty fl::any_error>";

    return "error: " + std::string(e.message());
}
} // namespace fl

fl::any_error fl::to_error(std::exception_ptr const& e)
{
    FL_ASSERT(e != nullptr, "to_error needs a captured exception");

    try
    {
        std::rethrow_exception(e);
    }
    catch (any_error const& err)
    {
        return err;
    }
    catch (std::exception const& ex)
    {
        return any_error(ex);
    }
    catch (std::string const& s)
    {
        return any_error(s);
    }
    catch (char const* s)
    {
        return any_error(s);
    }
    catch (long long i)
    {
        return any_error(fl::to_string(i));
    }
    catch (long i)
    {
        return any_error(fl::to_string(i));
    }
    catch (int i)
    {
        return any_error(fl::to_string(i));
    }
    catch (unsigned long long i)
    {
        return any_error(fl::to_string(i));
    }
    catch (unsigned long i)
    {
        return any_error(fl::to_string(i));
    }
    catch (unsigned i)
    {
        return any_error(fl::to_string(i));
    }
    catch (double f)
    {
        return any_error(fl::to_string(f));
    }
    catch (float f)
    {
        return any_error(fl::to_string(f));
    }
    catch (...) // thrown type is not inspectable, the failure itself is still reported
    {
        return any_error("unknown exception");
    }
}
