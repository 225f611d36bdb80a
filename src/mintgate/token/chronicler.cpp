#include <mintgate/token/chronicler.hpp>

#include <utility>

namespace mintgate::token {

/*
 * Chronicler session
 */

void chronicler_session::push_event( const protocol::event& ev )
{
  _events.push_back( ev );
}

const std::vector< protocol::event >& chronicler_session::events() const
{
  return _events;
}

/*
 * Chronicler
 */

void chronicler::set_session( std::shared_ptr< chronicler_session > s )
{
  _session = s;
}

void chronicler::push_event( protocol::event_data&& data )
{
  protocol::event ev;
  ev.sequence = _seq_no;
  ev.impacted = protocol::impacted_accounts( data );
  ev.data     = std::move( data );

  if( auto session = _session.lock() )
    session->push_event( ev );

  _events.emplace_back( std::move( ev ) );
  _seq_no++;
}

const std::vector< protocol::event >& chronicler::events() const
{
  return _events;
}

} // namespace mintgate::token
