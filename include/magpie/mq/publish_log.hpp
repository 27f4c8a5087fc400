#pragma once

#include <magpie/mq/message_broker.hpp>

#include <boost/container/flat_map.hpp>

#include <cstdint>
#include <vector>

namespace magpie::mq {

/**
 * Messages handed to a channel whose broker confirmation has not come back yet.
 *
 * Entries are keyed by a sequence number assigned on append, so iteration
 * order is send order. reset() hands the whole batch back for replay and
 * leaves the log empty.
 */
class publish_log final
{
public:
  using sequence_number = uint64_t;

  sequence_number append( const message& msg );

  // Removes the entry. Unknown sequence numbers are ignored.
  bool confirm( sequence_number seq );

  std::vector< message > reset();

  std::size_t count() const;

private:
  boost::container::flat_map< sequence_number, message > _entries;
  sequence_number _next_sequence = 0;
};

} // namespace magpie::mq
