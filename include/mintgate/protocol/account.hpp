#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <string>
#include <string_view>

#include <mintgate/protocol/error.hpp>

namespace mintgate::protocol {

constexpr std::size_t account_length = 20;

/**
 * An opaque fixed width address. The all zero value is the zero (burn)
 * account and is never a valid recipient of funds.
 */
struct account: std::array< std::byte, account_length >
{
  bool zero() const noexcept;

  bool operator==( const account& ) const                  = default;
  std::strong_ordering operator<=>( const account& ) const = default;
};

constexpr account zero_account{};

/**
 * Parse the "0x" prefixed hex form of an account.
 */
result< account > account_from_string( std::string_view str ) noexcept;

std::string to_string( const account& a );

} // namespace mintgate::protocol
