#pragma once

#include <mintgate/token/error.hpp>

namespace mintgate::token {

// Strict toggle: pausing twice or unpausing an active ledger is an error
class pause_gate final
{
public:
  pause_gate()                    = default;
  pause_gate( const pause_gate& ) = delete;
  pause_gate( pause_gate&& )      = delete;
  ~pause_gate()                   = default;

  pause_gate& operator=( const pause_gate& ) = delete;
  pause_gate& operator=( pause_gate&& )      = delete;

  bool paused() const noexcept;

  std::error_code check() const;

  std::error_code pause();
  std::error_code unpause();

private:
  bool _paused = false;
};

} // namespace mintgate::token
