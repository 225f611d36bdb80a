#include <mintgate/protocol/event.hpp>

#include <algorithm>
#include <initializer_list>
#include <sstream>

#include <mintgate/protocol/overloaded.hpp>

namespace mintgate::protocol {

std::string_view name( const event_data& data ) noexcept
{
  return std::visit( overloaded{ []( const transfer_event& ) { return std::string_view{ "Transfer" }; },
                                 []( const approval_event& ) { return std::string_view{ "Approval" }; },
                                 []( const paused_event& ) { return std::string_view{ "Paused" }; },
                                 []( const unpaused_event& ) { return std::string_view{ "Unpaused" }; },
                                 []( const role_granted_event& ) { return std::string_view{ "RoleGranted" }; },
                                 []( const role_revoked_event& ) { return std::string_view{ "RoleRevoked" }; },
                                 []( const ownership_transferred_event& )
                                 { return std::string_view{ "OwnershipTransferred" }; } },
                     data );
}

static std::vector< account > distinct_nonzero( std::initializer_list< account > accounts )
{
  std::vector< account > result;
  for( const auto& a: accounts )
  {
    if( !a.zero() && std::ranges::find( result, a ) == result.end() )
      result.push_back( a );
  }
  return result;
}

std::vector< account > impacted_accounts( const event_data& data )
{
  return std::visit( overloaded{ []( const transfer_event& e ) { return distinct_nonzero( { e.from, e.to } ); },
                                 []( const approval_event& e ) { return distinct_nonzero( { e.owner, e.spender } ); },
                                 []( const paused_event& e ) { return distinct_nonzero( { e.caller } ); },
                                 []( const unpaused_event& e ) { return distinct_nonzero( { e.caller } ); },
                                 []( const role_granted_event& e ) { return distinct_nonzero( { e.account, e.sender } ); },
                                 []( const role_revoked_event& e ) { return distinct_nonzero( { e.account, e.sender } ); },
                                 []( const ownership_transferred_event& e )
                                 { return distinct_nonzero( { e.previous_owner, e.new_owner } ); } },
                     data );
}

std::string to_string( const event& ev )
{
  std::stringstream ss;
  ss << "#" << ev.sequence << " " << name( ev.data );

  std::visit( overloaded{ [ & ]( const transfer_event& e )
                          {
                            ss << " from=" << to_string( e.from ) << " to=" << to_string( e.to )
                               << " value=" << to_string( e.value );
                          },
                          [ & ]( const approval_event& e )
                          {
                            ss << " owner=" << to_string( e.owner ) << " spender=" << to_string( e.spender )
                               << " value=" << to_string( e.value );
                          },
                          [ & ]( const paused_event& e ) { ss << " account=" << to_string( e.caller ); },
                          [ & ]( const unpaused_event& e ) { ss << " account=" << to_string( e.caller ); },
                          [ & ]( const role_granted_event& e )
                          {
                            ss << " role=" << to_string( e.role ) << " account=" << to_string( e.account )
                               << " sender=" << to_string( e.sender );
                          },
                          [ & ]( const role_revoked_event& e )
                          {
                            ss << " role=" << to_string( e.role ) << " account=" << to_string( e.account )
                               << " sender=" << to_string( e.sender );
                          },
                          [ & ]( const ownership_transferred_event& e )
                          {
                            ss << " previous=" << to_string( e.previous_owner )
                               << " new=" << to_string( e.new_owner );
                          } },
              ev.data );

  return ss.str();
}

} // namespace mintgate::protocol
