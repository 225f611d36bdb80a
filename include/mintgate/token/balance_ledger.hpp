#pragma once

#include <map>

#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/amount.hpp>
#include <mintgate/token/error.hpp>

namespace mintgate::token {

/**
 * Balances, allowances and total supply.
 *
 * Every mutator validates all of its preconditions before touching state, so
 * a returned error means nothing changed. Accounts with a zero balance are not
 * retained. The ledger knows nothing about roles or pausing; those guards are
 * applied by the caller before an operation reaches the ledger.
 */
class balance_ledger final
{
public:
  balance_ledger()                        = default;
  balance_ledger( const balance_ledger& ) = delete;
  balance_ledger( balance_ledger&& )      = delete;
  ~balance_ledger()                       = default;

  balance_ledger& operator=( const balance_ledger& ) = delete;
  balance_ledger& operator=( balance_ledger&& )      = delete;

  const protocol::amount& total_supply() const noexcept;
  protocol::amount balance_of( const protocol::account& account ) const;
  protocol::amount allowance( const protocol::account& owner, const protocol::account& spender ) const;

  std::error_code transfer( const protocol::account& from, const protocol::account& to, const protocol::amount& value );

  /**
   * Move value from one account to another on behalf of spender, consuming
   * allowance. An allowance of max_amount is unlimited and is not consumed.
   */
  std::error_code transfer_from( const protocol::account& spender,
                                 const protocol::account& from,
                                 const protocol::account& to,
                                 const protocol::amount& value );

  std::error_code
  approve( const protocol::account& owner, const protocol::account& spender, const protocol::amount& value );

  std::error_code mint( const protocol::account& to, const protocol::amount& value );

  /**
   * Sum of every retained balance. Equal to total_supply() at all times.
   */
  protocol::amount sum_of_balances() const;

private:
  std::error_code check_transfer( const protocol::account& from,
                                  const protocol::account& to,
                                  const protocol::amount& value ) const;
  void move( const protocol::account& from, const protocol::account& to, const protocol::amount& value );

  std::map< protocol::account, protocol::amount > _balances;
  std::map< protocol::account, std::map< protocol::account, protocol::amount > > _allowances;
  protocol::amount _total_supply = 0;
};

} // namespace mintgate::token
