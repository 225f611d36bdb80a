#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <mintgate/controller.hpp>
#include <mintgate/protocol.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  static mintgate::protocol::account make_account( std::uint8_t id );

  template< typename Operation >
  mintgate::protocol::transaction make_transaction( const mintgate::protocol::account& caller, Operation&& op ) const
  {
    mintgate::protocol::transaction t;
    t.caller    = caller;
    t.operation = std::forward< Operation >( op );
    return t;
  }

  template< typename Operation >
  mintgate::controller::result< mintgate::protocol::transaction_receipt >
  submit( const mintgate::protocol::account& caller, Operation&& op )
  {
    return _controller->process( make_transaction( caller, std::forward< Operation >( op ) ) );
  }

  enum verification : std::uint_fast8_t
  {
    none         = 0,
    processed    = 1 << 0,
    conserved    = 1 << 1,
    with_events  = 1 << 2,
    event_free   = 1 << 3
  };

  bool verify( const mintgate::controller::result< mintgate::protocol::transaction_receipt >& receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< mintgate::controller::controller > _controller;
  mintgate::controller::genesis_data _genesis_data;
  mintgate::protocol::account _deployer;
};

} // namespace test
