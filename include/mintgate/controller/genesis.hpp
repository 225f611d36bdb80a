#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

#include <mintgate/controller/error.hpp>
#include <mintgate/protocol/account.hpp>
#include <mintgate/protocol/amount.hpp>

namespace mintgate::controller {

/**
 * Everything needed to construct a ledger.
 *
 * The YAML form is a map with the keys name, symbol, initial_supply (a
 * decimal string) and deployer (a hex account). Only deployer is required.
 */
struct genesis_data
{
  std::string name   = "AdwaitToken";
  std::string symbol = "ADW";
  protocol::amount initial_supply{ "1000000000000000000000000" };
  protocol::account deployer{};
};

result< genesis_data > load_genesis( const YAML::Node& node );

} // namespace mintgate::controller
