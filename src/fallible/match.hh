#pragma once

#include <fallible/option.hh>
#include <fallible/result.hh>
#include <fallible/utility.hh>

namespace fl
{
/// Free form of option::match and result::match, exactly one handler is invoked
/// Usage:
///   auto text = fl::match(lookup(id),
///                         [](user const& u) { return u.name; },
///                         [] { return std::string("anonymous"); });
///
///   auto code = fl::match(fl::move(res),
///                         [](int v) { return v; },
///                         [](fl::any_error const&) { return -1; });
template <class Source, class OnSuccess, class OnFailure>
    requires(is_option<Source> || is_result<Source>)
decltype(auto) match(Source&& source, OnSuccess&& on_success, OnFailure&& on_failure)
{
    return fl::forward<Source>(source).match(fl::forward<OnSuccess>(on_success), fl::forward<OnFailure>(on_failure));
}
} // namespace fl
