#include <mintgate/controller/controller.hpp>

#include <memory>
#include <stdexcept>

#include <mintgate/log.hpp>
#include <mintgate/protocol/overloaded.hpp>

namespace mintgate::controller {

static const protocol::account& checked_deployer( const genesis_data& genesis )
{
  if( genesis.deployer.zero() )
    throw std::runtime_error( "genesis deployer cannot be the zero account" );

  return genesis.deployer;
}

controller::controller( const genesis_data& genesis ):
    _token( genesis.name, genesis.symbol, genesis.initial_supply, checked_deployer( genesis ) )
{
  LOG_INFO( log::instance(),
            "Created ledger {} ({}) - Supply: {}, Deployer: {}",
            genesis.name,
            genesis.symbol,
            protocol::to_string( genesis.initial_supply ),
            log::hex{ genesis.deployer.data(), genesis.deployer.size() } );
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction )
{
  std::lock_guard< std::mutex > lock( _mutex );

  auto session = std::make_shared< token::chronicler_session >();
  _token.set_session( session );
  auto ec = apply( transaction.caller, transaction.operation );
  _token.set_session( nullptr );

  if( ec )
  {
    LOG_INFO( log::instance(),
              "Rejected {} from {}: {}",
              protocol::name( transaction.operation ),
              log::hex{ transaction.caller.data(), transaction.caller.size() },
              ec.message() );
    return std::unexpected( ec );
  }

  LOG_DEBUG( log::instance(),
             "Applied {} from {} [{} event(s)]",
             protocol::name( transaction.operation ),
             log::hex{ transaction.caller.data(), transaction.caller.size() },
             session->events().size() );

  protocol::transaction_receipt receipt;
  receipt.events = session->events();
  return receipt;
}

std::error_code controller::apply( const protocol::account& caller, const protocol::operation& operation )
{
  return std::visit(
    protocol::overloaded{
      [ & ]( const protocol::transfer_operation& op ) { return _token.transfer( caller, op.to, op.value ); },
      [ & ]( const protocol::approve_operation& op ) { return _token.approve( caller, op.spender, op.value ); },
      [ & ]( const protocol::transfer_from_operation& op )
      { return _token.transfer_from( caller, op.from, op.to, op.value ); },
      [ & ]( const protocol::mint_operation& op ) { return _token.mint( caller, op.to, op.value ); },
      [ & ]( const protocol::pause_operation& ) { return _token.pause( caller ); },
      [ & ]( const protocol::unpause_operation& ) { return _token.unpause( caller ); },
      [ & ]( const protocol::grant_role_operation& op ) { return _token.grant_role( caller, op.role, op.account ); },
      [ & ]( const protocol::revoke_role_operation& op ) { return _token.revoke_role( caller, op.role, op.account ); },
      [ & ]( const protocol::renounce_role_operation& op )
      { return _token.renounce_role( caller, op.role, op.account ); },
      [ & ]( const protocol::grant_minter_role_operation& op ) { return _token.grant_minter_role( caller, op.account ); },
      [ & ]( const protocol::revoke_minter_role_operation& op )
      { return _token.revoke_minter_role( caller, op.account ); },
      [ & ]( const protocol::transfer_ownership_operation& op )
      { return _token.transfer_ownership( caller, op.new_owner ); },
      [ & ]( const protocol::renounce_ownership_operation& ) { return _token.renounce_ownership( caller ); } },
    operation );
}

std::string controller::name() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.name();
}

std::string controller::symbol() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.symbol();
}

std::uint8_t controller::decimals() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.decimals();
}

protocol::amount controller::total_supply() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.total_supply();
}

protocol::amount controller::balance_of( const protocol::account& account ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.balance_of( account );
}

protocol::amount controller::allowance( const protocol::account& owner, const protocol::account& spender ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.allowance( owner, spender );
}

bool controller::paused() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.paused();
}

bool controller::has_role( protocol::role role, const protocol::account& account ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.has_role( role, account );
}

bool controller::is_admin( const protocol::account& account ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.is_admin( account );
}

bool controller::is_minter( const protocol::account& account ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.is_minter( account );
}

protocol::role controller::role_admin( protocol::role role ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.role_admin( role );
}

protocol::account controller::owner() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.owner();
}

std::vector< protocol::event > controller::events() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.events();
}

bool controller::conserved() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _token.conserved();
}

} // namespace mintgate::controller
