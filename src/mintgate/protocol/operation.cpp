#include <mintgate/protocol/operation.hpp>

#include <type_traits>

namespace mintgate::protocol {

std::string_view name( const operation& op ) noexcept
{
  return std::visit(
    []< typename T >( const T& ) -> std::string_view
    {
      if constexpr( std::is_same_v< T, transfer_operation > )
        return "transfer";
      else if constexpr( std::is_same_v< T, approve_operation > )
        return "approve";
      else if constexpr( std::is_same_v< T, transfer_from_operation > )
        return "transfer_from";
      else if constexpr( std::is_same_v< T, mint_operation > )
        return "mint";
      else if constexpr( std::is_same_v< T, pause_operation > )
        return "pause";
      else if constexpr( std::is_same_v< T, unpause_operation > )
        return "unpause";
      else if constexpr( std::is_same_v< T, grant_role_operation > )
        return "grant_role";
      else if constexpr( std::is_same_v< T, revoke_role_operation > )
        return "revoke_role";
      else if constexpr( std::is_same_v< T, renounce_role_operation > )
        return "renounce_role";
      else if constexpr( std::is_same_v< T, grant_minter_role_operation > )
        return "grant_minter_role";
      else if constexpr( std::is_same_v< T, revoke_minter_role_operation > )
        return "revoke_minter_role";
      else if constexpr( std::is_same_v< T, transfer_ownership_operation > )
        return "transfer_ownership";
      else
      {
        static_assert( std::is_same_v< T, renounce_ownership_operation > );
        return "renounce_ownership";
      }
    },
    op );
}

} // namespace mintgate::protocol
