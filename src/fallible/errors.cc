#include "errors.hh"

void fl::impl::throw_option_error(std::string const& message)
{
    throw option_error(message);
}

void fl::impl::throw_result_error(std::string const& message)
{
    throw result_error(message);
}
