#pragma once

#include <mintgate/token/access_registry.hpp>
#include <mintgate/token/balance_ledger.hpp>
#include <mintgate/token/chronicler.hpp>
#include <mintgate/token/error.hpp>
#include <mintgate/token/pause_gate.hpp>
#include <mintgate/token/token.hpp>
