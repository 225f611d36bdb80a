#pragma once

#include <expected>
#include <system_error>

namespace mintgate::shell {

enum class shell_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_command,
  unknown_command,
  wrong_argument_count
};

const std::error_category& shell_category() noexcept;

std::error_code make_error_code( shell_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintgate::shell

template<>
struct std::is_error_code_enum< mintgate::shell::shell_errc >: public std::true_type
{};
