#include <mintgate/token/token.hpp>

#include <utility>

namespace mintgate::token {

token::token( std::string name,
              std::string symbol,
              const protocol::amount& initial_supply,
              const protocol::account& deployer ):
    _name( std::move( name ) ),
    _symbol( std::move( symbol ) ),
    _registry( deployer )
{
  _chronicler.push_event( protocol::ownership_transferred_event{ protocol::zero_account, deployer } );
  _chronicler.push_event( protocol::role_granted_event{ protocol::role::admin, deployer, deployer } );
  _chronicler.push_event( protocol::role_granted_event{ protocol::role::minter, deployer, deployer } );

  if( initial_supply > 0 )
  {
    if( auto ec = _ledger.mint( deployer, initial_supply ); ec )
      throw std::system_error( ec, "unable to credit initial supply" );

    _chronicler.push_event( protocol::transfer_event{ protocol::zero_account, deployer, initial_supply } );
  }
}

const std::string& token::name() const noexcept
{
  return _name;
}

const std::string& token::symbol() const noexcept
{
  return _symbol;
}

std::uint8_t token::decimals() const noexcept
{
  return token_decimals;
}

const protocol::amount& token::total_supply() const noexcept
{
  return _ledger.total_supply();
}

protocol::amount token::balance_of( const protocol::account& account ) const
{
  return _ledger.balance_of( account );
}

protocol::amount token::allowance( const protocol::account& owner, const protocol::account& spender ) const
{
  return _ledger.allowance( owner, spender );
}

std::error_code
token::transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value )
{
  if( auto ec = _gate.check(); ec )
    return ec;

  if( auto ec = _ledger.transfer( caller, to, value ); ec )
    return ec;

  _chronicler.push_event( protocol::transfer_event{ caller, to, value } );
  return token_errc::ok;
}

std::error_code
token::approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value )
{
  if( auto ec = _ledger.approve( caller, spender, value ); ec )
    return ec;

  _chronicler.push_event( protocol::approval_event{ caller, spender, value } );
  return token_errc::ok;
}

std::error_code token::transfer_from( const protocol::account& caller,
                                      const protocol::account& from,
                                      const protocol::account& to,
                                      const protocol::amount& value )
{
  if( auto ec = _gate.check(); ec )
    return ec;

  if( auto ec = _ledger.transfer_from( caller, from, to, value ); ec )
    return ec;

  _chronicler.push_event( protocol::transfer_event{ from, to, value } );
  return token_errc::ok;
}

std::error_code token::mint( const protocol::account& caller, const protocol::account& to, const protocol::amount& value )
{
  if( auto ec = _registry.check_role( protocol::role::minter, caller ); ec )
    return ec;

  if( auto ec = _gate.check(); ec )
    return ec;

  if( auto ec = _ledger.mint( to, value ); ec )
    return ec;

  _chronicler.push_event( protocol::transfer_event{ protocol::zero_account, to, value } );
  return token_errc::ok;
}

bool token::paused() const noexcept
{
  return _gate.paused();
}

std::error_code token::pause( const protocol::account& caller )
{
  if( auto ec = _registry.check_role( protocol::role::admin, caller ); ec )
    return ec;

  if( auto ec = _gate.pause(); ec )
    return ec;

  _chronicler.push_event( protocol::paused_event{ caller } );
  return token_errc::ok;
}

std::error_code token::unpause( const protocol::account& caller )
{
  if( auto ec = _registry.check_role( protocol::role::admin, caller ); ec )
    return ec;

  if( auto ec = _gate.unpause(); ec )
    return ec;

  _chronicler.push_event( protocol::unpaused_event{ caller } );
  return token_errc::ok;
}

bool token::has_role( protocol::role role, const protocol::account& account ) const
{
  return _registry.has_role( role, account );
}

bool token::is_admin( const protocol::account& account ) const
{
  return _registry.is_admin( account );
}

bool token::is_minter( const protocol::account& account ) const
{
  return _registry.is_minter( account );
}

protocol::role token::role_admin( protocol::role role ) const noexcept
{
  return _registry.role_admin( role );
}

std::error_code
token::grant_role( const protocol::account& caller, protocol::role role, const protocol::account& account )
{
  auto granted = _registry.grant_role( caller, role, account );
  if( !granted )
    return granted.error();

  if( *granted )
    _chronicler.push_event( protocol::role_granted_event{ role, account, caller } );

  return token_errc::ok;
}

std::error_code
token::revoke_role( const protocol::account& caller, protocol::role role, const protocol::account& account )
{
  auto revoked = _registry.revoke_role( caller, role, account );
  if( !revoked )
    return revoked.error();

  if( *revoked )
    _chronicler.push_event( protocol::role_revoked_event{ role, account, caller } );

  return token_errc::ok;
}

std::error_code
token::renounce_role( const protocol::account& caller, protocol::role role, const protocol::account& account )
{
  auto renounced = _registry.renounce_role( caller, role, account );
  if( !renounced )
    return renounced.error();

  if( *renounced )
    _chronicler.push_event( protocol::role_revoked_event{ role, account, caller } );

  return token_errc::ok;
}

std::error_code token::grant_minter_role( const protocol::account& caller, const protocol::account& account )
{
  return grant_role( caller, protocol::role::minter, account );
}

std::error_code token::revoke_minter_role( const protocol::account& caller, const protocol::account& account )
{
  return revoke_role( caller, protocol::role::minter, account );
}

const protocol::account& token::owner() const noexcept
{
  return _registry.owner();
}

std::error_code token::transfer_ownership( const protocol::account& caller, const protocol::account& new_owner )
{
  auto previous = _registry.transfer_ownership( caller, new_owner );
  if( !previous )
    return previous.error();

  _chronicler.push_event( protocol::ownership_transferred_event{ *previous, new_owner } );
  return token_errc::ok;
}

std::error_code token::renounce_ownership( const protocol::account& caller )
{
  auto previous = _registry.renounce_ownership( caller );
  if( !previous )
    return previous.error();

  _chronicler.push_event( protocol::ownership_transferred_event{ *previous, protocol::zero_account } );
  return token_errc::ok;
}

const std::vector< protocol::event >& token::events() const
{
  return _chronicler.events();
}

void token::set_session( std::shared_ptr< chronicler_session > session )
{
  _chronicler.set_session( std::move( session ) );
}

bool token::conserved() const
{
  return _ledger.total_supply() == _ledger.sum_of_balances();
}

} // namespace mintgate::token
