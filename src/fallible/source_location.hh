#pragma once

#include <source_location>

namespace fl
{
/// Type alias for std::source_location
/// Used by any_error and fl::err to remember where an error was raised
/// Usage:
///   auto e = fl::any_error("disk full");      // site() is this line
///   auto r = fl::result<int>(fl::err("nope")); // site() is the fl::err call
using source_location = std::source_location;
} // namespace fl
