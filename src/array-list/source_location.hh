#pragma once

#include <source_location>

namespace al
{
/// Type alias for std::source_location
/// Captured by assertions so failure reports point at the call site
/// Usage:
///   void log(al::source_location loc = al::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace al
