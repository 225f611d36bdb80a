#pragma once

#include <cstdint>
#include <string_view>

#include <mintgate/protocol/error.hpp>

namespace mintgate::protocol {

enum class role : std::uint8_t
{
  admin,
  minter
};

std::string_view to_string( role r ) noexcept;

/**
 * Accepts the canonical role names ("DEFAULT_ADMIN_ROLE", "MINTER_ROLE") and
 * the short forms "admin" and "minter".
 */
result< role > role_from_string( std::string_view str ) noexcept;

} // namespace mintgate::protocol
