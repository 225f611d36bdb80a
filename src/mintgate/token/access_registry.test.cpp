#include <gtest/gtest.h>

#include <mintgate/token/access_registry.hpp>

using mintgate::protocol::account;
using mintgate::protocol::role;
using mintgate::token::token_errc;

static account make_account( std::uint8_t id )
{
  account a{};
  a.back() = std::byte{ id };
  return a;
}

TEST( access_registry, deployer_holds_everything )
{
  auto deployer = make_account( 1 );
  mintgate::token::access_registry registry( deployer );

  EXPECT_TRUE( registry.is_admin( deployer ) );
  EXPECT_TRUE( registry.is_minter( deployer ) );
  EXPECT_EQ( registry.owner(), deployer );
  EXPECT_EQ( registry.member_count( role::admin ), 1 );
  EXPECT_EQ( registry.member_count( role::minter ), 1 );
  EXPECT_FALSE( registry.check_role( role::admin, deployer ) );
  EXPECT_EQ( registry.check_role( role::admin, make_account( 2 ) ), token_errc::unauthorized );
}

TEST( access_registry, grant_and_revoke_report_changes )
{
  auto deployer = make_account( 1 );
  auto alice    = make_account( 2 );
  mintgate::token::access_registry registry( deployer );

  auto granted = registry.grant_role( deployer, role::minter, alice );
  ASSERT_TRUE( granted );
  EXPECT_TRUE( *granted );

  granted = registry.grant_role( deployer, role::minter, alice );
  ASSERT_TRUE( granted );
  EXPECT_FALSE( *granted );

  auto revoked = registry.revoke_role( deployer, role::minter, alice );
  ASSERT_TRUE( revoked );
  EXPECT_TRUE( *revoked );

  revoked = registry.revoke_role( deployer, role::minter, alice );
  ASSERT_TRUE( revoked );
  EXPECT_FALSE( *revoked );

  EXPECT_EQ( registry.grant_role( alice, role::minter, alice ).error(), token_errc::unauthorized );
  EXPECT_EQ( registry.revoke_role( alice, role::minter, deployer ).error(), token_errc::unauthorized );
}

TEST( access_registry, minters_may_be_empty )
{
  auto deployer = make_account( 1 );
  mintgate::token::access_registry registry( deployer );

  EXPECT_TRUE( registry.renounce_role( deployer, role::minter, deployer ) );
  EXPECT_EQ( registry.member_count( role::minter ), 0 );
  EXPECT_FALSE( registry.is_minter( deployer ) );
}

TEST( access_registry, admins_never_empty )
{
  auto deployer = make_account( 1 );
  mintgate::token::access_registry registry( deployer );

  EXPECT_EQ( registry.revoke_role( deployer, role::admin, deployer ).error(), token_errc::last_administrator );
  EXPECT_EQ( registry.renounce_role( deployer, role::admin, deployer ).error(), token_errc::last_administrator );
  EXPECT_EQ( registry.member_count( role::admin ), 1 );
}

TEST( access_registry, ownership )
{
  auto deployer = make_account( 1 );
  auto alice    = make_account( 2 );
  mintgate::token::access_registry registry( deployer );

  auto previous = registry.transfer_ownership( deployer, alice );
  ASSERT_TRUE( previous );
  EXPECT_EQ( *previous, deployer );
  EXPECT_EQ( registry.owner(), alice );

  // Ownership transfer does not touch roles
  EXPECT_TRUE( registry.is_admin( deployer ) );
  EXPECT_FALSE( registry.is_admin( alice ) );

  EXPECT_EQ( registry.renounce_ownership( deployer ).error(), token_errc::unauthorized );

  previous = registry.renounce_ownership( alice );
  ASSERT_TRUE( previous );
  EXPECT_EQ( *previous, alice );
  EXPECT_TRUE( registry.owner().zero() );
}
