#include <mintgate/controller/genesis.hpp>

#include <mintgate/log.hpp>

namespace mintgate::controller {

static result< std::string > scalar( const YAML::Node& node, const char* key )
{
  auto value = node[ key ];
  if( !value || !value.IsScalar() )
  {
    LOG_ERROR( log::instance(), "Genesis entry '{}' must be a scalar", key );
    return std::unexpected( controller_errc::invalid_genesis );
  }

  return value.Scalar();
}

result< genesis_data > load_genesis( const YAML::Node& node )
{
  if( !node.IsMap() )
  {
    LOG_ERROR( log::instance(), "Genesis data must be a map" );
    return std::unexpected( controller_errc::invalid_genesis );
  }

  genesis_data data;

  if( node[ "name" ] )
  {
    auto name = scalar( node, "name" );
    if( !name )
      return std::unexpected( name.error() );

    data.name = std::move( *name );
  }

  if( node[ "symbol" ] )
  {
    auto symbol = scalar( node, "symbol" );
    if( !symbol )
      return std::unexpected( symbol.error() );

    data.symbol = std::move( *symbol );
  }

  if( node[ "initial_supply" ] )
  {
    auto supply = scalar( node, "initial_supply" ).and_then(
      []( const std::string& str ) -> result< protocol::amount > { return protocol::amount_from_string( str ); } );

    if( !supply )
    {
      LOG_ERROR( log::instance(), "Genesis initial supply is not a valid amount: {}", supply.error().message() );
      return std::unexpected( controller_errc::invalid_genesis );
    }

    data.initial_supply = *supply;
  }

  auto deployer = scalar( node, "deployer" ).and_then(
    []( const std::string& str ) -> result< protocol::account > { return protocol::account_from_string( str ); } );

  if( !deployer || deployer->zero() )
  {
    LOG_ERROR( log::instance(), "Genesis deployer must be a non-zero account" );
    return std::unexpected( controller_errc::invalid_genesis );
  }

  data.deployer = *deployer;
  return data;
}

} // namespace mintgate::controller
