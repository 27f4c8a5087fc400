#pragma once

#include <magpie/mq/message_broker.hpp>
#include <magpie/mq/util.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/signals2/connection.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace magpie::mq {

class publish_log;
class topology;

struct exchange_options
{
  std::string name;
  std::string type = exchange_type::topic;
  bool durable     = true;
  bool internal    = false;
  bool auto_delete = false;
  std::optional< std::string > alternate_exchange;
  std::map< std::string, std::string > arguments;

  // Zero falls back to the connection default, which may also be zero (unbounded).
  std::chrono::milliseconds publish_timeout = std::chrono::milliseconds( 0 );
};

// Broker arguments for the exchange declaration, including the alternate exchange.
inline std::map< std::string, std::string > declare_arguments( const exchange_options& options )
{
  auto args = options.arguments;

  if( options.alternate_exchange )
    args[ argument::alternate_exchange ] = *options.alternate_exchange;

  return args;
}

using completion_handler = std::function< void( std::exception_ptr ) >;
using strand_type        = boost::asio::strand< boost::asio::io_context::executor_type >;

/**
 * A live binding of one exchange definition to one connection attempt.
 *
 * Completion handlers receive a null exception_ptr on success. The released
 * signal fires at most once, when the broker revokes the channel.
 *
 * A publish appends its message to the publish log and removes it once the
 * broker acks or nacks it. When the channel or the connection goes away first
 * the caller is rejected but the entry stays, so the message is sent again
 * after the next reconnect even though its caller was told it failed.
 */
class channel
{
public:
  virtual ~channel() = default;

  virtual void define( completion_handler handler ) = 0;
  virtual void publish( const message& msg, completion_handler handler ) = 0;
  virtual void destroy( completion_handler handler ) = 0;

  virtual boost::signals2::connection on_released( const std::function< void() >& slot ) = 0;
};

class channel_factory
{
public:
  virtual ~channel_factory() = default;

  virtual std::shared_ptr< channel >
  create( const exchange_options& options, topology& topo, std::shared_ptr< publish_log > log, strand_type strand ) = 0;
};

} // namespace magpie::mq
