// NOLINTBEGIN

#include <gtest/gtest.h>

#include <type_traits>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <mintgate/protocol.hpp>
#include <mintgate/token.hpp>

using mintgate::protocol::account;
using mintgate::protocol::amount;
using mintgate::protocol::role;
using mintgate::token::token_errc;

static account make_account( std::uint8_t id )
{
  account a{};
  a.back() = std::byte{ id };
  return a;
}

class token_test: public ::testing::Test
{
public:
  token_test():
      initial_supply( amount( 1'000'000 ) * boost::multiprecision::pow( amount( 10 ), 18 ) ),
      deployer( make_account( 1 ) ),
      alice( make_account( 2 ) ),
      bob( make_account( 3 ) ),
      carol( make_account( 4 ) ),
      ledger( "AdwaitToken", "ADW", initial_supply, deployer )
  {}

  token_test( const token_test& ) = delete;
  token_test( token_test&& )      = delete;

  ~token_test() override = default;

  token_test& operator=( const token_test& ) = delete;
  token_test& operator=( token_test&& )      = delete;

  amount initial_supply;
  account deployer;
  account alice;
  account bob;
  account carol;
  mintgate::token::token ledger;
};

TEST_F( token_test, construction )
{
  EXPECT_EQ( ledger.name(), "AdwaitToken" );
  EXPECT_EQ( ledger.symbol(), "ADW" );
  EXPECT_EQ( ledger.decimals(), 18 );

  EXPECT_EQ( ledger.total_supply(), initial_supply );
  EXPECT_EQ( ledger.balance_of( deployer ), initial_supply );
  EXPECT_EQ( mintgate::protocol::to_string( ledger.total_supply() ), "1000000000000000000000000" );

  EXPECT_TRUE( ledger.is_admin( deployer ) );
  EXPECT_TRUE( ledger.is_minter( deployer ) );
  EXPECT_FALSE( ledger.is_admin( alice ) );
  EXPECT_FALSE( ledger.is_minter( alice ) );
  EXPECT_EQ( ledger.owner(), deployer );
  EXPECT_FALSE( ledger.paused() );
  EXPECT_TRUE( ledger.conserved() );

  const auto& history = ledger.events();
  ASSERT_EQ( history.size(), 4 );
  EXPECT_EQ( mintgate::protocol::name( history[ 0 ].data ), "OwnershipTransferred" );
  EXPECT_EQ( mintgate::protocol::name( history[ 1 ].data ), "RoleGranted" );
  EXPECT_EQ( mintgate::protocol::name( history[ 2 ].data ), "RoleGranted" );
  EXPECT_EQ( mintgate::protocol::name( history[ 3 ].data ), "Transfer" );

  const auto& ownership = std::get< mintgate::protocol::ownership_transferred_event >( history[ 0 ].data );
  EXPECT_TRUE( ownership.previous_owner.zero() );
  EXPECT_EQ( ownership.new_owner, deployer );
  EXPECT_EQ( std::get< mintgate::protocol::role_granted_event >( history[ 1 ].data ).role,
             mintgate::protocol::role::admin );
  EXPECT_EQ( std::get< mintgate::protocol::role_granted_event >( history[ 2 ].data ).role,
             mintgate::protocol::role::minter );

  const auto& mint = std::get< mintgate::protocol::transfer_event >( ledger.events().back().data );
  EXPECT_TRUE( mint.from.zero() );
  EXPECT_EQ( mint.to, deployer );
  EXPECT_EQ( mint.value, initial_supply );
}

TEST_F( token_test, construction_without_supply )
{
  mintgate::token::token empty( "Empty", "NIL", 0, alice );

  EXPECT_EQ( empty.total_supply(), 0 );
  EXPECT_EQ( empty.balance_of( alice ), 0 );
  EXPECT_TRUE( empty.is_admin( alice ) );

  for( const auto& ev: empty.events() )
    EXPECT_NE( mintgate::protocol::name( ev.data ), "Transfer" );
}

TEST_F( token_test, transfer )
{
  EXPECT_FALSE( ledger.transfer( deployer, alice, 100 ) );
  EXPECT_EQ( ledger.balance_of( alice ), 100 );
  EXPECT_EQ( ledger.balance_of( deployer ), amount( initial_supply - 100 ) );
  EXPECT_EQ( ledger.total_supply(), initial_supply );
  EXPECT_TRUE( ledger.conserved() );

  const auto& ev = std::get< mintgate::protocol::transfer_event >( ledger.events().back().data );
  EXPECT_EQ( ev.from, deployer );
  EXPECT_EQ( ev.to, alice );
  EXPECT_EQ( ev.value, 100 );
}

TEST_F( token_test, transfer_insufficient_balance )
{
  ASSERT_FALSE( ledger.transfer( deployer, alice, 100 ) );
  auto event_count = ledger.events().size();

  EXPECT_EQ( ledger.transfer( alice, bob, 200 ), token_errc::insufficient_balance );
  EXPECT_EQ( ledger.balance_of( alice ), 100 );
  EXPECT_EQ( ledger.balance_of( bob ), 0 );
  EXPECT_EQ( ledger.events().size(), event_count );
  EXPECT_TRUE( ledger.conserved() );
}

TEST_F( token_test, transfer_entire_balance )
{
  ASSERT_FALSE( ledger.transfer( deployer, alice, 100 ) );
  EXPECT_FALSE( ledger.transfer( alice, bob, 100 ) );
  EXPECT_EQ( ledger.balance_of( alice ), 0 );
  EXPECT_EQ( ledger.balance_of( bob ), 100 );
  EXPECT_TRUE( ledger.conserved() );
}

TEST_F( token_test, transfer_zero_amount )
{
  auto event_count = ledger.events().size();

  EXPECT_FALSE( ledger.transfer( alice, bob, 0 ) );
  EXPECT_EQ( ledger.balance_of( alice ), 0 );
  EXPECT_EQ( ledger.balance_of( bob ), 0 );
  EXPECT_EQ( ledger.events().size(), event_count + 1 );
  EXPECT_TRUE( ledger.conserved() );
}

TEST_F( token_test, transfer_to_self )
{
  EXPECT_FALSE( ledger.transfer( deployer, deployer, 100 ) );
  EXPECT_EQ( ledger.balance_of( deployer ), initial_supply );
  EXPECT_TRUE( ledger.conserved() );
}

TEST_F( token_test, transfer_to_zero_account )
{
  EXPECT_EQ( ledger.transfer( deployer, mintgate::protocol::zero_account, 100 ), token_errc::invalid_recipient );
  EXPECT_EQ( ledger.balance_of( deployer ), initial_supply );
  EXPECT_EQ( ledger.balance_of( mintgate::protocol::zero_account ), 0 );
}

TEST_F( token_test, approve_and_transfer_from )
{
  EXPECT_FALSE( ledger.approve( deployer, alice, 500 ) );
  EXPECT_EQ( ledger.allowance( deployer, alice ), 500 );

  const auto& approval = std::get< mintgate::protocol::approval_event >( ledger.events().back().data );
  EXPECT_EQ( approval.owner, deployer );
  EXPECT_EQ( approval.spender, alice );
  EXPECT_EQ( approval.value, 500 );

  EXPECT_FALSE( ledger.transfer_from( alice, deployer, bob, 200 ) );
  EXPECT_EQ( ledger.allowance( deployer, alice ), 300 );
  EXPECT_EQ( ledger.balance_of( bob ), 200 );
  EXPECT_EQ( ledger.balance_of( deployer ), amount( initial_supply - 200 ) );

  const auto& moved = std::get< mintgate::protocol::transfer_event >( ledger.events().back().data );
  EXPECT_EQ( moved.from, deployer );
  EXPECT_EQ( moved.to, bob );

  EXPECT_EQ( ledger.transfer_from( alice, deployer, bob, 301 ), token_errc::insufficient_allowance );
  EXPECT_EQ( ledger.allowance( deployer, alice ), 300 );
  EXPECT_EQ( ledger.balance_of( bob ), 200 );
  EXPECT_TRUE( ledger.conserved() );
}

TEST_F( token_test, approve_overwrites )
{
  EXPECT_FALSE( ledger.approve( deployer, alice, 500 ) );
  EXPECT_FALSE( ledger.approve( deployer, alice, 5 ) );
  EXPECT_EQ( ledger.allowance( deployer, alice ), 5 );
  EXPECT_EQ( ledger.allowance( alice, deployer ), 0 );
}

TEST_F( token_test, approve_zero_spender )
{
  EXPECT_EQ( ledger.approve( deployer, mintgate::protocol::zero_account, 5 ), token_errc::invalid_spender );
}

TEST_F( token_test, transfer_from_insufficient_balance_keeps_allowance )
{
  ASSERT_FALSE( ledger.transfer( deployer, alice, 10 ) );
  ASSERT_FALSE( ledger.approve( alice, bob, 100 ) );

  EXPECT_EQ( ledger.transfer_from( bob, alice, carol, 50 ), token_errc::insufficient_balance );
  EXPECT_EQ( ledger.allowance( alice, bob ), 100 );
  EXPECT_EQ( ledger.balance_of( alice ), 10 );
  EXPECT_EQ( ledger.balance_of( carol ), 0 );
}

TEST_F( token_test, transfer_from_unlimited_allowance )
{
  ASSERT_FALSE( ledger.approve( deployer, alice, mintgate::protocol::max_amount ) );

  EXPECT_FALSE( ledger.transfer_from( alice, deployer, bob, 1'000 ) );
  EXPECT_EQ( ledger.allowance( deployer, alice ), mintgate::protocol::max_amount );
  EXPECT_EQ( ledger.balance_of( bob ), 1'000 );
}

TEST_F( token_test, mint_role_lifecycle )
{
  EXPECT_EQ( ledger.mint( alice, bob, 1'000 ), token_errc::unauthorized );

  EXPECT_FALSE( ledger.grant_minter_role( deployer, alice ) );
  EXPECT_TRUE( ledger.is_minter( alice ) );

  const auto& granted = std::get< mintgate::protocol::role_granted_event >( ledger.events().back().data );
  EXPECT_EQ( granted.role, role::minter );
  EXPECT_EQ( granted.account, alice );
  EXPECT_EQ( granted.sender, deployer );

  EXPECT_FALSE( ledger.mint( alice, bob, 1'000 ) );
  EXPECT_EQ( ledger.balance_of( bob ), 1'000 );
  EXPECT_EQ( ledger.total_supply(), amount( initial_supply + 1'000 ) );
  EXPECT_TRUE( ledger.conserved() );

  EXPECT_FALSE( ledger.revoke_minter_role( deployer, alice ) );
  EXPECT_FALSE( ledger.is_minter( alice ) );

  const auto& revoked = std::get< mintgate::protocol::role_revoked_event >( ledger.events().back().data );
  EXPECT_EQ( revoked.role, role::minter );
  EXPECT_EQ( revoked.account, alice );

  EXPECT_EQ( ledger.mint( alice, bob, 1'000 ), token_errc::unauthorized );
  EXPECT_EQ( ledger.balance_of( bob ), 1'000 );
  EXPECT_EQ( ledger.total_supply(), amount( initial_supply + 1'000 ) );
}

TEST_F( token_test, mint_to_zero_account )
{
  EXPECT_EQ( ledger.mint( deployer, mintgate::protocol::zero_account, 1 ), token_errc::invalid_recipient );
  EXPECT_EQ( ledger.total_supply(), initial_supply );
}

TEST_F( token_test, mint_overflow )
{
  EXPECT_EQ( ledger.mint( deployer, alice, mintgate::protocol::max_amount ), token_errc::overflow );
  EXPECT_EQ( ledger.total_supply(), initial_supply );
  EXPECT_EQ( ledger.balance_of( alice ), 0 );

  EXPECT_FALSE( ledger.mint( deployer, alice, mintgate::protocol::max_amount - initial_supply ) );
  EXPECT_EQ( ledger.total_supply(), mintgate::protocol::max_amount );
  EXPECT_EQ( ledger.mint( deployer, alice, 1 ), token_errc::overflow );
  EXPECT_TRUE( ledger.conserved() );
}

TEST_F( token_test, pause_gating )
{
  ASSERT_FALSE( ledger.approve( deployer, alice, 100 ) );

  EXPECT_FALSE( ledger.pause( deployer ) );
  EXPECT_TRUE( ledger.paused() );
  EXPECT_TRUE( std::holds_alternative< mintgate::protocol::paused_event >( ledger.events().back().data ) );

  auto event_count = ledger.events().size();

  EXPECT_EQ( ledger.transfer( deployer, bob, 100 ), token_errc::paused );
  EXPECT_EQ( ledger.transfer_from( alice, deployer, bob, 100 ), token_errc::paused );
  EXPECT_EQ( ledger.mint( deployer, bob, 100 ), token_errc::paused );
  EXPECT_EQ( ledger.balance_of( bob ), 0 );
  EXPECT_EQ( ledger.allowance( deployer, alice ), 100 );
  EXPECT_EQ( ledger.events().size(), event_count );

  // Administration and reads stay available
  EXPECT_FALSE( ledger.grant_minter_role( deployer, alice ) );
  EXPECT_FALSE( ledger.revoke_minter_role( deployer, alice ) );
  EXPECT_FALSE( ledger.approve( deployer, carol, 1 ) );
  EXPECT_EQ( ledger.balance_of( deployer ), initial_supply );

  EXPECT_FALSE( ledger.unpause( deployer ) );
  EXPECT_FALSE( ledger.paused() );
  EXPECT_TRUE( std::holds_alternative< mintgate::protocol::unpaused_event >( ledger.events().back().data ) );

  EXPECT_FALSE( ledger.transfer( deployer, bob, 100 ) );
  EXPECT_EQ( ledger.balance_of( bob ), 100 );
}

TEST_F( token_test, pause_toggle_is_strict )
{
  EXPECT_EQ( ledger.unpause( deployer ), token_errc::not_paused );
  EXPECT_FALSE( ledger.pause( deployer ) );
  EXPECT_EQ( ledger.pause( deployer ), token_errc::already_paused );
  EXPECT_TRUE( ledger.paused() );
  EXPECT_FALSE( ledger.unpause( deployer ) );
  EXPECT_EQ( ledger.unpause( deployer ), token_errc::not_paused );
  EXPECT_FALSE( ledger.paused() );
}

TEST_F( token_test, administration_requires_admin )
{
  EXPECT_EQ( ledger.pause( alice ), token_errc::unauthorized );
  EXPECT_EQ( ledger.grant_minter_role( alice, bob ), token_errc::unauthorized );
  EXPECT_EQ( ledger.revoke_minter_role( alice, deployer ), token_errc::unauthorized );
  EXPECT_EQ( ledger.grant_role( alice, role::admin, alice ), token_errc::unauthorized );

  ASSERT_FALSE( ledger.pause( deployer ) );
  EXPECT_EQ( ledger.unpause( alice ), token_errc::unauthorized );
  EXPECT_TRUE( ledger.paused() );

  // A minter is not an admin
  ASSERT_FALSE( ledger.grant_minter_role( deployer, alice ) );
  EXPECT_EQ( ledger.unpause( alice ), token_errc::unauthorized );
}

TEST_F( token_test, role_changes_are_idempotent )
{
  ASSERT_FALSE( ledger.grant_minter_role( deployer, alice ) );
  auto event_count = ledger.events().size();

  EXPECT_FALSE( ledger.grant_minter_role( deployer, alice ) );
  EXPECT_EQ( ledger.events().size(), event_count );

  EXPECT_FALSE( ledger.revoke_minter_role( deployer, bob ) );
  EXPECT_EQ( ledger.events().size(), event_count );
}

TEST_F( token_test, generic_roles )
{
  EXPECT_EQ( ledger.role_admin( role::minter ), role::admin );
  EXPECT_EQ( ledger.role_admin( role::admin ), role::admin );

  EXPECT_FALSE( ledger.grant_role( deployer, role::admin, alice ) );
  EXPECT_TRUE( ledger.has_role( role::admin, alice ) );

  // The new admin can pause and manage minters
  EXPECT_FALSE( ledger.pause( alice ) );
  EXPECT_FALSE( ledger.unpause( alice ) );
  EXPECT_FALSE( ledger.grant_minter_role( alice, bob ) );
  EXPECT_TRUE( ledger.is_minter( bob ) );

  EXPECT_FALSE( ledger.revoke_role( alice, role::admin, deployer ) );
  EXPECT_FALSE( ledger.is_admin( deployer ) );
  EXPECT_EQ( ledger.pause( deployer ), token_errc::unauthorized );

  // Ownership is an independent channel
  EXPECT_EQ( ledger.owner(), deployer );
  EXPECT_EQ( ledger.transfer_ownership( alice, bob ), token_errc::unauthorized );
  EXPECT_FALSE( ledger.transfer_ownership( deployer, bob ) );
}

TEST_F( token_test, renounce_role )
{
  ASSERT_FALSE( ledger.grant_minter_role( deployer, alice ) );

  EXPECT_EQ( ledger.renounce_role( bob, role::minter, alice ), token_errc::unauthorized );
  EXPECT_TRUE( ledger.is_minter( alice ) );

  EXPECT_FALSE( ledger.renounce_role( alice, role::minter, alice ) );
  EXPECT_FALSE( ledger.is_minter( alice ) );

  const auto& revoked = std::get< mintgate::protocol::role_revoked_event >( ledger.events().back().data );
  EXPECT_EQ( revoked.account, alice );
  EXPECT_EQ( revoked.sender, alice );
}

TEST_F( token_test, last_administrator_is_kept )
{
  EXPECT_EQ( ledger.revoke_role( deployer, role::admin, deployer ), token_errc::last_administrator );
  EXPECT_EQ( ledger.renounce_role( deployer, role::admin, deployer ), token_errc::last_administrator );
  EXPECT_TRUE( ledger.is_admin( deployer ) );

  ASSERT_FALSE( ledger.grant_role( deployer, role::admin, alice ) );
  EXPECT_FALSE( ledger.renounce_role( deployer, role::admin, deployer ) );
  EXPECT_FALSE( ledger.is_admin( deployer ) );
  EXPECT_EQ( ledger.revoke_role( alice, role::admin, alice ), token_errc::last_administrator );
  EXPECT_TRUE( ledger.is_admin( alice ) );
}

TEST_F( token_test, ownership )
{
  EXPECT_EQ( ledger.transfer_ownership( alice, alice ), token_errc::unauthorized );
  EXPECT_EQ( ledger.transfer_ownership( deployer, mintgate::protocol::zero_account ), token_errc::invalid_owner );

  EXPECT_FALSE( ledger.transfer_ownership( deployer, alice ) );
  EXPECT_EQ( ledger.owner(), alice );

  const auto& transferred = std::get< mintgate::protocol::ownership_transferred_event >( ledger.events().back().data );
  EXPECT_EQ( transferred.previous_owner, deployer );
  EXPECT_EQ( transferred.new_owner, alice );

  // Ownership carries no admin or minter capability
  EXPECT_EQ( ledger.pause( alice ), token_errc::unauthorized );
  EXPECT_EQ( ledger.mint( alice, alice, 1 ), token_errc::unauthorized );
  EXPECT_FALSE( ledger.pause( deployer ) );

  EXPECT_EQ( ledger.transfer_ownership( deployer, bob ), token_errc::unauthorized );

  EXPECT_FALSE( ledger.renounce_ownership( alice ) );
  EXPECT_TRUE( ledger.owner().zero() );
  EXPECT_EQ( ledger.transfer_ownership( alice, bob ), token_errc::unauthorized );
  EXPECT_EQ( ledger.renounce_ownership( alice ), token_errc::unauthorized );
}

TEST_F( token_test, event_sessions )
{
  auto session = std::make_shared< mintgate::token::chronicler_session >();
  ledger.set_session( session );

  ASSERT_FALSE( ledger.transfer( deployer, alice, 1 ) );
  ASSERT_FALSE( ledger.approve( alice, bob, 1 ) );
  EXPECT_EQ( ledger.transfer( alice, bob, 2 ), token_errc::insufficient_balance );

  ledger.set_session( nullptr );
  ASSERT_FALSE( ledger.transfer( deployer, alice, 1 ) );

  ASSERT_EQ( session->events().size(), 2 );
  EXPECT_EQ( mintgate::protocol::name( session->events()[ 0 ].data ), "Transfer" );
  EXPECT_EQ( mintgate::protocol::name( session->events()[ 1 ].data ), "Approval" );

  const auto& history = ledger.events();
  for( std::size_t i = 0; i < history.size(); ++i )
    EXPECT_EQ( history[ i ].sequence, i );
}

TEST( chronicler, sequence_numbers )
{
  static_assert( std::is_same_v< decltype( mintgate::protocol::event::sequence ), std::uint64_t > );

  const auto caller = make_account( 7 );
  mintgate::token::chronicler recorder;
  recorder.push_event( mintgate::protocol::paused_event{ caller } );
  recorder.push_event( mintgate::protocol::unpaused_event{ caller } );

  ASSERT_EQ( recorder.events().size(), 2 );
  EXPECT_EQ( recorder.events()[ 0 ].sequence, std::uint64_t( 0 ) );
  EXPECT_EQ( recorder.events()[ 1 ].sequence, std::uint64_t( 1 ) );
  EXPECT_EQ( recorder.events()[ 1 ].impacted, std::vector< account >{ caller } );
}

TEST_F( token_test, conservation_over_random_operations )
{
  std::array< account, 4 > accounts{ deployer, alice, bob, carol };
  ASSERT_FALSE( ledger.grant_minter_role( deployer, alice ) );

  std::uint32_t state = 42;
  auto next           = [ & ]()
  {
    state = state * 1'664'525u + 1'013'904'223u;
    return state >> 8;
  };

  for( int i = 0; i < 500; ++i )
  {
    const auto& a = accounts[ next() % accounts.size() ];
    const auto& b = accounts[ next() % accounts.size() ];
    amount value  = next() % 10'000;

    switch( next() % 6 )
    {
      case 0:
        (void)ledger.transfer( a, b, value );
        break;
      case 1:
        (void)ledger.approve( a, b, value );
        break;
      case 2:
        (void)ledger.transfer_from( a, b, accounts[ next() % accounts.size() ], value );
        break;
      case 3:
        (void)ledger.mint( a, b, value );
        break;
      case 4:
        (void)ledger.pause( a );
        break;
      default:
        (void)ledger.unpause( a );
        break;
    }

    ASSERT_TRUE( ledger.conserved() );
  }
}

// NOLINTEND
