#pragma once

#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/amount.hpp>
#include <mintgate/protocol/error.hpp>
#include <mintgate/protocol/event.hpp>
#include <mintgate/protocol/operation.hpp>
#include <mintgate/protocol/role.hpp>
#include <mintgate/protocol/transaction.hpp>
