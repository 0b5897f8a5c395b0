#include "error.hh"

namespace
{
std::string make_message(std::string_view argument_name)
{
    auto msg = std::string("required argument '");
    msg += argument_name;
    msg += "' is absent";
    return msg;
}
} // namespace

lk::argument_error::argument_error(std::string_view argument_name, lk::source_location site)
  : std::invalid_argument(make_message(argument_name)), _argument_name(argument_name), _site(site)
{
}

void lk::impl::throw_missing_argument(char const* argument_name, lk::source_location site)
{
    throw lk::argument_error(argument_name, site);
}
