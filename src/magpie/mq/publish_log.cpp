#include <magpie/mq/publish_log.hpp>

namespace magpie::mq {

publish_log::sequence_number publish_log::append( const message& msg )
{
  auto seq = _next_sequence++;
  _entries.emplace_hint( _entries.end(), seq, msg );
  return seq;
}

bool publish_log::confirm( sequence_number seq )
{
  return _entries.erase( seq ) > 0;
}

std::vector< message > publish_log::reset()
{
  std::vector< message > undelivered;
  undelivered.reserve( _entries.size() );

  for( auto& entry: _entries )
    undelivered.push_back( std::move( entry.second ) );

  _entries.clear();
  return undelivered;
}

std::size_t publish_log::count() const
{
  return _entries.size();
}

} // namespace magpie::mq
