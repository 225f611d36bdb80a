#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/amount.hpp>
#include <mintgate/protocol/role.hpp>

namespace mintgate::protocol {

// Minting is reported as a transfer from the zero account
struct transfer_event
{
  account from{};
  account to{};
  amount value = 0;
};

struct approval_event
{
  account owner{};
  account spender{};
  amount value = 0;
};

struct paused_event
{
  account caller{};
};

struct unpaused_event
{
  account caller{};
};

struct role_granted_event
{
  protocol::role role = protocol::role::admin;
  protocol::account account{};
  protocol::account sender{};
};

struct role_revoked_event
{
  protocol::role role = protocol::role::admin;
  protocol::account account{};
  protocol::account sender{};
};

struct ownership_transferred_event
{
  account previous_owner{};
  account new_owner{};
};

using event_data = std::variant< transfer_event,
                                 approval_event,
                                 paused_event,
                                 unpaused_event,
                                 role_granted_event,
                                 role_revoked_event,
                                 ownership_transferred_event >;

struct event
{
  std::uint64_t sequence = 0;
  event_data data;
  std::vector< account > impacted;
};

std::string_view name( const event_data& data ) noexcept;

/**
 * The distinct non-zero accounts an event refers to, in field order.
 */
std::vector< account > impacted_accounts( const event_data& data );

std::string to_string( const event& ev );

} // namespace mintgate::protocol
