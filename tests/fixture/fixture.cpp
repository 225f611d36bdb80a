// NOLINTBEGIN

#include <test/fixture.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <mintgate/log.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level ):
    _deployer( make_account( 1 ) )
{
  mintgate::log::initialize( log_level );

  _genesis_data.name           = "AdwaitToken";
  _genesis_data.symbol         = "ADW";
  _genesis_data.initial_supply = mintgate::protocol::amount( 1'000'000 ) * boost::multiprecision::pow( mintgate::protocol::amount( 10 ), 18 );
  _genesis_data.deployer       = _deployer;

  LOG_INFO( mintgate::log::instance(), "Starting fixture: {}", name );
  _controller = std::make_unique< mintgate::controller::controller >( _genesis_data );
}

fixture::~fixture()
{
  _controller.reset();
}

mintgate::protocol::account fixture::make_account( std::uint8_t id )
{
  mintgate::protocol::account a{};
  a.back() = std::byte{ id };
  return a;
}

bool fixture::verify( const mintgate::controller::result< mintgate::protocol::transaction_receipt >& receipt,
                      std::uint64_t flags ) const
{
  if( flags & verification::processed )
  {
    if( !receipt.has_value() )
    {
      LOG_WARNING( mintgate::log::instance(), "Transaction rejected: {}", receipt.error().message() );
      return false;
    }
  }

  if( flags & verification::conserved )
  {
    if( !_controller->conserved() )
    {
      LOG_WARNING( mintgate::log::instance(), "Total supply does not match the sum of balances" );
      return false;
    }
  }

  if( flags & verification::with_events )
  {
    if( !receipt.has_value() || receipt->events.empty() )
      return false;
  }

  if( flags & verification::event_free )
  {
    if( receipt.has_value() && !receipt->events.empty() )
      return false;
  }

  return true;
}

} // namespace test

// NOLINTEND
