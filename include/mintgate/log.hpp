#pragma once

#include <mintgate/log/log.hpp>
