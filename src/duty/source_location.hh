#pragma once

#include <source_location>

namespace duty
{
/// Type alias for std::source_location
/// Provides information about source code location (file, line, column, function)
/// Usage:
///   void report(duty::source_location loc = duty::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace duty
