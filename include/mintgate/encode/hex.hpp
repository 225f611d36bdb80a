#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <mintgate/encode/error.hpp>

namespace mintgate::encode {

/**
 * Encode bytes as lower case hex with a leading "0x".
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

/**
 * Decode a hex string. The "0x" prefix is optional and both cases are accepted.
 */
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

/**
 * Decode a hex string into a fixed size buffer. The string must encode exactly
 * out.size() bytes.
 */
std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept;

} // namespace mintgate::encode
