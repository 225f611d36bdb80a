#pragma once

#include <map>
#include <set>

#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/role.hpp>
#include <mintgate/token/error.hpp>

namespace mintgate::token {

/**
 * Role membership and the single owner slot.
 *
 * Roles and ownership are independent authorities. Role changes require the
 * administering role of the target role, ownership changes require the
 * current owner, and neither check stands in for the other.
 *
 * Role mutators return whether membership actually changed so the caller can
 * decide whether to report it.
 */
class access_registry final
{
public:
  explicit access_registry( const protocol::account& deployer );
  access_registry( const access_registry& ) = delete;
  access_registry( access_registry&& )      = delete;
  ~access_registry()                        = default;

  access_registry& operator=( const access_registry& ) = delete;
  access_registry& operator=( access_registry&& )      = delete;

  bool has_role( protocol::role role, const protocol::account& account ) const;
  bool is_admin( const protocol::account& account ) const;
  bool is_minter( const protocol::account& account ) const;
  std::size_t member_count( protocol::role role ) const;

  /**
   * The role whose members may grant and revoke role. Every role is
   * administered by the admin role.
   */
  protocol::role role_admin( protocol::role role ) const noexcept;

  std::error_code check_role( protocol::role role, const protocol::account& account ) const;

  result< bool > grant_role( const protocol::account& caller, protocol::role role, const protocol::account& account );
  result< bool > revoke_role( const protocol::account& caller, protocol::role role, const protocol::account& account );

  /**
   * Drop a role held by the caller. account must equal caller.
   */
  result< bool > renounce_role( const protocol::account& caller, protocol::role role, const protocol::account& account );

  const protocol::account& owner() const noexcept;

  /**
   * Replace the owner. Returns the previous owner.
   */
  result< protocol::account > transfer_ownership( const protocol::account& caller, const protocol::account& new_owner );

  /**
   * Leave the ledger without an owner. Returns the previous owner.
   */
  result< protocol::account > renounce_ownership( const protocol::account& caller );

private:
  result< bool > remove( protocol::role role, const protocol::account& account );

  std::map< protocol::role, std::set< protocol::account > > _members;
  protocol::account _owner;
};

} // namespace mintgate::token
