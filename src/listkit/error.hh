#pragma once

#include <listkit/fwd.hh>
#include <listkit/macros.hh>
#include <listkit/source_location.hh>

#include <stdexcept>
#include <string>
#include <string_view>

/// Thrown when a required argument was not provided, e.g. an absent predicate.
/// Derives from std::invalid_argument so generic handlers catch it as well.
/// Always thrown before the operation touches its input, so a caught argument_error
/// guarantees the list is unmodified.
///
/// Usage:
///   try
///   {
///       lk::remove_first(values, lk::function_ref<bool(int const&)>{});
///   }
///   catch (lk::argument_error const& e)
///   {
///       // e.argument_name() == "predicate"
///   }
class lk::argument_error : public std::invalid_argument
{
public:
    explicit argument_error(std::string_view argument_name, lk::source_location site = lk::source_location::current());

    /// name of the offending parameter
    [[nodiscard]] std::string const& argument_name() const noexcept { return _argument_name; }

    /// where the failing operation was called from
    [[nodiscard]] lk::source_location const& site() const noexcept { return _site; }

private:
    std::string _argument_name;
    lk::source_location _site;
};

namespace lk::impl
{
/// throws lk::argument_error for `argument_name`
/// out-of-line so that the hot paths of the list templates stay small
[[noreturn]] LK_COLD_FUNC void throw_missing_argument(char const* argument_name, lk::source_location site);
} // namespace lk::impl
