#pragma once

#include <string_view>
#include <variant>

#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/amount.hpp>
#include <mintgate/protocol/role.hpp>

namespace mintgate::protocol {

struct transfer_operation
{
  account to{};
  amount value = 0;
};

struct approve_operation
{
  account spender{};
  amount value = 0;
};

struct transfer_from_operation
{
  account from{};
  account to{};
  amount value = 0;
};

struct mint_operation
{
  account to{};
  amount value = 0;
};

struct pause_operation
{};

struct unpause_operation
{};

struct grant_role_operation
{
  protocol::role role = protocol::role::admin;
  protocol::account account{};
};

struct revoke_role_operation
{
  protocol::role role = protocol::role::admin;
  protocol::account account{};
};

struct renounce_role_operation
{
  protocol::role role = protocol::role::admin;
  protocol::account account{};
};

struct grant_minter_role_operation
{
  protocol::account account{};
};

struct revoke_minter_role_operation
{
  protocol::account account{};
};

struct transfer_ownership_operation
{
  account new_owner{};
};

struct renounce_ownership_operation
{};

using operation = std::variant< transfer_operation,
                                approve_operation,
                                transfer_from_operation,
                                mint_operation,
                                pause_operation,
                                unpause_operation,
                                grant_role_operation,
                                revoke_role_operation,
                                renounce_role_operation,
                                grant_minter_role_operation,
                                revoke_minter_role_operation,
                                transfer_ownership_operation,
                                renounce_ownership_operation >;

std::string_view name( const operation& op ) noexcept;

} // namespace mintgate::protocol
