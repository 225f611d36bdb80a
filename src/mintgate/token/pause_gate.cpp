#include <mintgate/token/pause_gate.hpp>

namespace mintgate::token {

bool pause_gate::paused() const noexcept
{
  return _paused;
}

std::error_code pause_gate::check() const
{
  if( _paused )
    return token_errc::paused;

  return token_errc::ok;
}

std::error_code pause_gate::pause()
{
  if( _paused )
    return token_errc::already_paused;

  _paused = true;
  return token_errc::ok;
}

std::error_code pause_gate::unpause()
{
  if( !_paused )
    return token_errc::not_paused;

  _paused = false;
  return token_errc::ok;
}

} // namespace mintgate::token
