#include <mintgate/protocol/role.hpp>

#include <utility>

namespace mintgate::protocol {

std::string_view to_string( role r ) noexcept
{
  switch( r )
  {
    case role::admin:
      return "DEFAULT_ADMIN_ROLE";
    case role::minter:
      return "MINTER_ROLE";
  }
  std::unreachable();
}

result< role > role_from_string( std::string_view str ) noexcept
{
  if( str == "DEFAULT_ADMIN_ROLE" || str == "admin" )
    return role::admin;
  if( str == "MINTER_ROLE" || str == "minter" )
    return role::minter;

  return std::unexpected( protocol_errc::invalid_role );
}

} // namespace mintgate::protocol
