#pragma once

namespace mintgate::protocol {

/**
 * Builds a visitor for the protocol variants (operation, event_data) from a
 * set of lambdas.
 */
template< class... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

} // namespace mintgate::protocol
