#pragma once

#include <vector>

#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/event.hpp>
#include <mintgate/protocol/operation.hpp>

namespace mintgate::protocol {

/**
 * A single mutating request against the ledger, made on behalf of caller.
 */
struct transaction
{
  account caller{};
  protocol::operation operation;
};

struct transaction_receipt
{
  std::vector< event > events;
};

} // namespace mintgate::protocol
