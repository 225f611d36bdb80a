#pragma once

#include <expected>
#include <system_error>

namespace mintgate::token {

enum class token_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unauthorized,
  paused,
  already_paused,
  not_paused,
  insufficient_balance,
  insufficient_allowance,
  invalid_sender,
  invalid_recipient,
  invalid_spender,
  invalid_owner,
  overflow,
  last_administrator
};

const std::error_category& token_category() noexcept;

std::error_code make_error_code( token_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintgate::token

template<>
struct std::is_error_code_enum< mintgate::token::token_errc >: public std::true_type
{};
