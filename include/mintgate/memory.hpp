#pragma once

#include <mintgate/memory/memory.hpp>
