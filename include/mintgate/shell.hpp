#pragma once

#include <mintgate/shell/command.hpp>
#include <mintgate/shell/error.hpp>
