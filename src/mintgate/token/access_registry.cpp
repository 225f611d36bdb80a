#include <mintgate/token/access_registry.hpp>

namespace mintgate::token {

access_registry::access_registry( const protocol::account& deployer ):
    _owner( deployer )
{
  _members[ protocol::role::admin ].insert( deployer );
  _members[ protocol::role::minter ].insert( deployer );
}

bool access_registry::has_role( protocol::role role, const protocol::account& account ) const
{
  auto it = _members.find( role );
  if( it == _members.end() )
    return false;

  return it->second.contains( account );
}

bool access_registry::is_admin( const protocol::account& account ) const
{
  return has_role( protocol::role::admin, account );
}

bool access_registry::is_minter( const protocol::account& account ) const
{
  return has_role( protocol::role::minter, account );
}

std::size_t access_registry::member_count( protocol::role role ) const
{
  auto it = _members.find( role );
  if( it == _members.end() )
    return 0;

  return it->second.size();
}

protocol::role access_registry::role_admin( protocol::role ) const noexcept
{
  return protocol::role::admin;
}

std::error_code access_registry::check_role( protocol::role role, const protocol::account& account ) const
{
  if( !has_role( role, account ) )
    return token_errc::unauthorized;

  return token_errc::ok;
}

result< bool >
access_registry::grant_role( const protocol::account& caller, protocol::role role, const protocol::account& account )
{
  if( auto ec = check_role( role_admin( role ), caller ); ec )
    return std::unexpected( ec );

  return _members[ role ].insert( account ).second;
}

result< bool >
access_registry::revoke_role( const protocol::account& caller, protocol::role role, const protocol::account& account )
{
  if( auto ec = check_role( role_admin( role ), caller ); ec )
    return std::unexpected( ec );

  return remove( role, account );
}

result< bool >
access_registry::renounce_role( const protocol::account& caller, protocol::role role, const protocol::account& account )
{
  if( caller != account )
    return std::unexpected( token_errc::unauthorized );

  return remove( role, account );
}

result< bool > access_registry::remove( protocol::role role, const protocol::account& account )
{
  if( !has_role( role, account ) )
    return false;

  if( role == protocol::role::admin && member_count( role ) == 1 )
    return std::unexpected( token_errc::last_administrator );

  _members[ role ].erase( account );
  return true;
}

const protocol::account& access_registry::owner() const noexcept
{
  return _owner;
}

result< protocol::account > access_registry::transfer_ownership( const protocol::account& caller,
                                                                 const protocol::account& new_owner )
{
  if( caller != _owner || _owner.zero() )
    return std::unexpected( token_errc::unauthorized );

  if( new_owner.zero() )
    return std::unexpected( token_errc::invalid_owner );

  auto previous = _owner;
  _owner        = new_owner;
  return previous;
}

result< protocol::account > access_registry::renounce_ownership( const protocol::account& caller )
{
  if( caller != _owner || _owner.zero() )
    return std::unexpected( token_errc::unauthorized );

  auto previous = _owner;
  _owner        = protocol::zero_account;
  return previous;
}

} // namespace mintgate::token
