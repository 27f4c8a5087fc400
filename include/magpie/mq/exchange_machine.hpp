#pragma once

#include <magpie/mq/channel.hpp>
#include <magpie/mq/connection.hpp>
#include <magpie/mq/deferred_completion.hpp>
#include <magpie/mq/publish_log.hpp>
#include <magpie/mq/topology.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/signals2/signal.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace magpie::mq {

enum class exchange_state
{
  setup,
  initializing,
  ready,
  failed,
  reconnecting,
  reconnected,
  destroyed
};

std::string to_string( exchange_state s );

/**
 * Tracks whether an exchange is usable and decides, per state, whether a call
 * runs now, waits for a later state, or fails.
 *
 * Every input is handled on a strand of the io_context, one at a time. A call
 * that cannot run in the current state is parked in a queue for the state it
 * waits on and replayed, in submission order, on entry to that state.
 *
 * After a reconnect the new channel redefines the exchange, and once the
 * topology reports its bindings the unconfirmed publish log is replayed. A
 * replay failure is logged and the machine becomes ready anyway, accepting
 * the possible loss of those messages to keep the exchange available.
 */
class exchange_machine final: public std::enable_shared_from_this< exchange_machine >
{
public:
  using defined_func    = std::function< void() >;
  using failed_func     = std::function< void( std::exception_ptr ) >;
  using destroyed_func  = std::function< void() >;
  using transition_func = std::function< void( exchange_state, exchange_state ) >;

  static std::shared_ptr< exchange_machine > create( boost::asio::io_context& ioc,
                                                     const exchange_options& options,
                                                     broker_connection& connection,
                                                     topology& topo,
                                                     std::shared_ptr< channel_factory > factory );

  ~exchange_machine();

  const std::string& name() const;
  const std::string& type() const;

  exchange_state state() const;

  std::shared_future< void > publish( const message& msg,
                                      std::optional< std::chrono::milliseconds > timeout = std::nullopt );
  std::shared_future< void > check();
  std::shared_future< void > destroy();

  // Only consistent when read from the io_context thread.
  std::size_t unconfirmed() const;

  boost::signals2::connection on_defined( const defined_func& slot );
  boost::signals2::connection on_failed( const failed_func& slot );
  boost::signals2::connection on_destroyed( const destroyed_func& slot );
  boost::signals2::connection on_transition( const transition_func& slot );

private:
  struct publish_request
  {
    message msg;
    deferred_completion_ptr completion;
    std::unique_ptr< boost::asio::steady_timer > timer;
  };

  using publish_request_ptr = std::shared_ptr< publish_request >;
  using operation           = std::function< void() >;

  // Parked operations run from inside machine members only and never own the machine.
  struct deferred_operation
  {
    deferred_completion_ptr completion;
    operation op;
  };

  exchange_machine( boost::asio::io_context& ioc,
                    const exchange_options& options,
                    broker_connection& connection,
                    topology& topo,
                    std::shared_ptr< channel_factory > factory );

  void start();
  void listen_for_connection_events();
  void stop_listening();

  void transition( exchange_state to );
  void enter_state( exchange_state s );
  void defer_until( exchange_state s, deferred_completion_ptr completion, operation op );
  void drop_settled();
  void drain_deferred( exchange_state s );

  void create_channel();
  void define( exchange_state on_defined );
  void republish();
  void teardown();

  void handle_publish( const publish_request_ptr& r );
  void handle_check( const deferred_completion_ptr& c );
  void handle_destroy( const deferred_completion_ptr& c );
  void handle_released();
  void handle_bindings_completed();

  void execute_publish( const publish_request_ptr& r );
  void start_publish_timer( const publish_request_ptr& r, std::chrono::milliseconds timeout );
  void settle_publish( const publish_request_ptr& r, std::exception_ptr e );

  std::chrono::milliseconds resolve_publish_timeout( std::optional< std::chrono::milliseconds > timeout ) const;

  completion_handler on_strand( completion_handler h );

  strand_type _strand;
  exchange_options _options;
  broker_connection& _connection;
  topology& _topology;
  std::shared_ptr< channel_factory > _factory;

  std::atomic< exchange_state > _state = exchange_state::setup;
  std::shared_ptr< channel > _channel;
  uint64_t _generation = 0;
  std::exception_ptr _failed_with;

  std::shared_ptr< publish_log > _published;
  completion_tracker _deferred;
  std::map< exchange_state, std::deque< deferred_operation > > _deferred_ops;

  bool _tearing_down = false;
  std::vector< deferred_completion_ptr > _teardown_waiters;

  std::vector< boost::signals2::connection > _handlers;
  boost::signals2::scoped_connection _released_handler;

  boost::signals2::signal< void() > _defined;
  boost::signals2::signal< void( std::exception_ptr ) > _failed;
  boost::signals2::signal< void() > _destroyed;
  boost::signals2::signal< void( exchange_state, exchange_state ) > _transition;
};

} // namespace magpie::mq
