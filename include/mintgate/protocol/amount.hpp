#pragma once

#include <limits>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include <mintgate/protocol/error.hpp>

namespace mintgate::protocol {

using amount = boost::multiprecision::uint256_t;

inline const amount max_amount = std::numeric_limits< amount >::max();

/**
 * Parse a base 10 amount. Only digits are accepted and the value must fit in
 * 256 bits.
 */
result< amount > amount_from_string( std::string_view str );

std::string to_string( const amount& a );

} // namespace mintgate::protocol
