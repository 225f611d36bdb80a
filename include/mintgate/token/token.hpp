#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/amount.hpp>
#include <mintgate/protocol/event.hpp>
#include <mintgate/protocol/role.hpp>
#include <mintgate/token/access_registry.hpp>
#include <mintgate/token/balance_ledger.hpp>
#include <mintgate/token/chronicler.hpp>
#include <mintgate/token/error.hpp>
#include <mintgate/token/pause_gate.hpp>

namespace mintgate::token {

constexpr std::uint8_t token_decimals = 18;

/**
 * A fungible token with role gated minting and pausing and a single owner.
 *
 * The token composes a balance ledger, an access registry and a pause gate.
 * Every mutator takes the calling account first, checks the caller's
 * capability, then the pause gate, and only then hands the operation to the
 * ledger. A mutator that returns an error has changed nothing and emitted no
 * event.
 *
 * token is not thread safe. Concurrent use must be serialized by the owner of
 * the instance (see controller::controller).
 */
class token final
{
public:
  /**
   * Credit initial_supply to deployer, grant deployer the admin and minter
   * roles and make deployer the owner.
   */
  token( std::string name,
         std::string symbol,
         const protocol::amount& initial_supply,
         const protocol::account& deployer );
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token()              = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  const std::string& name() const noexcept;
  const std::string& symbol() const noexcept;
  std::uint8_t decimals() const noexcept;

  const protocol::amount& total_supply() const noexcept;
  protocol::amount balance_of( const protocol::account& account ) const;
  protocol::amount allowance( const protocol::account& owner, const protocol::account& spender ) const;

  std::error_code transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value );
  std::error_code
  approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value );
  std::error_code transfer_from( const protocol::account& caller,
                                 const protocol::account& from,
                                 const protocol::account& to,
                                 const protocol::amount& value );
  std::error_code mint( const protocol::account& caller, const protocol::account& to, const protocol::amount& value );

  bool paused() const noexcept;
  std::error_code pause( const protocol::account& caller );
  std::error_code unpause( const protocol::account& caller );

  bool has_role( protocol::role role, const protocol::account& account ) const;
  bool is_admin( const protocol::account& account ) const;
  bool is_minter( const protocol::account& account ) const;
  protocol::role role_admin( protocol::role role ) const noexcept;

  std::error_code grant_role( const protocol::account& caller, protocol::role role, const protocol::account& account );
  std::error_code revoke_role( const protocol::account& caller, protocol::role role, const protocol::account& account );
  std::error_code
  renounce_role( const protocol::account& caller, protocol::role role, const protocol::account& account );
  std::error_code grant_minter_role( const protocol::account& caller, const protocol::account& account );
  std::error_code revoke_minter_role( const protocol::account& caller, const protocol::account& account );

  const protocol::account& owner() const noexcept;
  std::error_code transfer_ownership( const protocol::account& caller, const protocol::account& new_owner );
  std::error_code renounce_ownership( const protocol::account& caller );

  /**
   * Every event emitted since construction, in sequence order.
   */
  const std::vector< protocol::event >& events() const;

  /**
   * Attach a session that receives the events of subsequent operations.
   * Pass nullptr to detach.
   */
  void set_session( std::shared_ptr< chronicler_session > session );

  /**
   * Verify total supply equals the sum of all balances.
   */
  bool conserved() const;

private:
  std::string _name;
  std::string _symbol;
  balance_ledger _ledger;
  access_registry _registry;
  pause_gate _gate;
  chronicler _chronicler;
};

} // namespace mintgate::token
