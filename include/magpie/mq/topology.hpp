#pragma once

#include <magpie/mq/channel.hpp>
#include <magpie/mq/connection.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/container/flat_map.hpp>
#include <boost/signals2/signal.hpp>

#include <functional>
#include <string>
#include <vector>

namespace magpie::mq {

class topology
{
public:
  virtual ~topology() = default;

  // Fires once every declared binding exists on the broker.
  virtual boost::signals2::connection on_bindings_completed( const std::function< void() >& slot ) = 0;

  // Called by a channel once its exchange is declared.
  virtual void exchange_defined( const exchange_options& options ) = 0;
};

struct queue_options
{
  std::string name;
  bool durable     = true;
  bool exclusive   = false;
  bool auto_delete = false;
};

struct binding
{
  std::string exchange;
  std::string queue;
  std::string pattern = "#";
};

class amqp_topology final: public topology
{
public:
  amqp_topology( boost::asio::io_context& ioc, amqp_connection& connection );
  ~amqp_topology() override;

  void add_exchange( const exchange_options& options );
  void add_queue( const queue_options& options );
  void add_binding( const binding& b );

  // Asserts everything known so far and emits bindings_completed on success.
  error_code configure();

  boost::signals2::connection on_bindings_completed( const std::function< void() >& slot ) override;
  void exchange_defined( const exchange_options& options ) override;

private:
  error_code assert_topology( channel_id channel );

  boost::asio::io_context& _ioc;
  amqp_connection& _connection;

  boost::container::flat_map< std::string, exchange_options > _exchanges;
  std::vector< queue_options > _queues;
  std::vector< binding > _bindings;

  boost::signals2::scoped_connection _reconnected_subscription;
  boost::signals2::signal< void() > _bindings_completed;
};

} // namespace magpie::mq
