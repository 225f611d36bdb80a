#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <mintgate/controller/controller.hpp>
#include <mintgate/protocol.hpp>
#include <mintgate/shell/error.hpp>

namespace mintgate::shell {

enum class query_kind : std::uint8_t
{
  name,
  symbol,
  decimals,
  total_supply,
  balance_of,
  allowance,
  paused,
  is_admin,
  is_minter,
  has_role,
  role_admin,
  owner,
  events
};

struct query
{
  query_kind kind = query_kind::name;
  protocol::account account{};
  protocol::account other{};
  protocol::role role = protocol::role::admin;
};

using command = std::variant< protocol::transaction, query >;

/**
 * Parse one line of input.
 *
 * Mutations are written "<caller> <operation> [args...]" where caller is a
 * hex account, for example "0x..01 transfer 0x..02 100". Anything else is a
 * read, for example "balance_of 0x..02".
 */
result< command > parse( std::string_view line );

/**
 * Run a command against the ledger and render the response. The first line
 * is "ok", a query value or "error: <message>". A successful transaction is
 * followed by one indented line per emitted event.
 */
std::string execute( controller::controller& ledger, const command& cmd );

/**
 * Execute every line of input until end of stream, writing one response per
 * command. Blank lines and lines starting with '#' are skipped; a line that
 * fails to parse answers "error: <message>" and serving continues.
 */
void serve( std::istream& input, std::ostream& output, controller::controller& ledger );

} // namespace mintgate::shell
