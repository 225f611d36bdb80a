#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <mintgate/protocol/event.hpp>

namespace mintgate::token {

/**
 * Collects the events of a single request while it is attached to a
 * chronicler.
 */
struct chronicler_session
{
  void push_event( const protocol::event& ev );
  const std::vector< protocol::event >& events() const;

private:
  std::vector< protocol::event > _events;
};

/**
 * Sequences and records every event the ledger emits. Events are also
 * forwarded to the attached session, if any.
 */
class chronicler final
{
public:
  void set_session( std::shared_ptr< chronicler_session > s );
  void push_event( protocol::event_data&& data );
  const std::vector< protocol::event >& events() const;

private:
  std::weak_ptr< chronicler_session > _session;
  std::vector< protocol::event > _events;
  std::uint64_t _seq_no = 0;
};

} // namespace mintgate::token
