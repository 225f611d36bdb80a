#pragma once

#include <mintgate/controller/controller.hpp>
#include <mintgate/controller/error.hpp>
#include <mintgate/controller/genesis.hpp>
