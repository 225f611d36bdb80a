#pragma once

#include <expected>
#include <system_error>

namespace mintgate::controller {

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_genesis
};

const std::error_category& controller_category() noexcept;

std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintgate::controller

template<>
struct std::is_error_code_enum< mintgate::controller::controller_errc >: public std::true_type
{};
