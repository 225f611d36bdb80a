#pragma once

#include <mintgate/encode/error.hpp>
#include <mintgate/encode/hex.hpp>
