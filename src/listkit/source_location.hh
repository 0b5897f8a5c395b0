#pragma once

#include <source_location>

namespace lk
{
/// Type alias for std::source_location
/// Used by assertions and lk::argument_error to report the failing call site
/// Usage:
///   void check(lk::source_location site = lk::source_location::current());
using source_location = std::source_location;
} // namespace lk
