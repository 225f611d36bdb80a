#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <mintgate/controller/error.hpp>
#include <mintgate/controller/genesis.hpp>
#include <mintgate/protocol.hpp>
#include <mintgate/token.hpp>

namespace mintgate::controller {

/**
 * The ledger service.
 *
 * controller is the exclusive owner of a single token. Every request, reads
 * included, runs under one mutex so no caller can observe a partially applied
 * operation. Callers never receive references into ledger state; results are
 * returned by value.
 */
class controller
{
public:
  explicit controller( const genesis_data& genesis );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller()                   = default;

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Apply a transaction. On success the receipt holds the events the
   * transaction emitted. On failure nothing has changed.
   */
  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

  std::string name() const;
  std::string symbol() const;
  std::uint8_t decimals() const;

  protocol::amount total_supply() const;
  protocol::amount balance_of( const protocol::account& account ) const;
  protocol::amount allowance( const protocol::account& owner, const protocol::account& spender ) const;

  bool paused() const;
  bool has_role( protocol::role role, const protocol::account& account ) const;
  bool is_admin( const protocol::account& account ) const;
  bool is_minter( const protocol::account& account ) const;
  protocol::role role_admin( protocol::role role ) const;
  protocol::account owner() const;

  std::vector< protocol::event > events() const;

  /**
   * Total supply equals the sum of all balances.
   */
  bool conserved() const;

private:
  std::error_code apply( const protocol::account& caller, const protocol::operation& operation );

  mutable std::mutex _mutex;
  token::token _token;
};

} // namespace mintgate::controller
