#pragma once

#include <magpie/mq/channel.hpp>
#include <magpie/mq/connection.hpp>
#include <magpie/mq/publish_log.hpp>
#include <magpie/mq/topology.hpp>

#include <boost/container/flat_map.hpp>
#include <boost/signals2/signal.hpp>

#include <memory>

namespace magpie::mq {

/**
 * Channel backed by its own AMQP channel number on a shared amqp_connection.
 *
 * All broker work and every connection event is handled on the strand the
 * channel was created with, so completion handlers never run inside the call
 * that started the operation. Publishes complete when the connection delivers
 * the broker's confirm for their delivery tag.
 */
class amqp_channel final: public channel,
                          public std::enable_shared_from_this< amqp_channel >
{
public:
  amqp_channel( strand_type strand,
                amqp_connection& connection,
                const exchange_options& options,
                topology& topo,
                std::shared_ptr< publish_log > log );
  ~amqp_channel() override;

  // Subscribes to the connection. Call once the channel is owned by a shared_ptr.
  void listen();

  void define( completion_handler handler ) override;
  void publish( const message& msg, completion_handler handler ) override;
  void destroy( completion_handler handler ) override;

  boost::signals2::connection on_released( const std::function< void() >& slot ) override;

  std::size_t outstanding() const;

private:
  struct pending_publish
  {
    publish_log::sequence_number seq;
    completion_handler handler;
  };

  void handle_confirm( const publisher_confirm& confirm );
  void handle_channel_closed();
  void handle_disconnected();
  void fail_pending( std::exception_ptr e );
  void release();
  std::string describe_error( error_code ec ) const;

  strand_type _strand;
  amqp_connection& _connection;
  std::shared_ptr< message_broker > _broker;
  exchange_options _options;
  topology& _topology;
  std::shared_ptr< publish_log > _log;

  channel_id _channel = 0;
  bool _released      = false;
  boost::container::flat_map< delivery_tag, pending_publish > _pending;

  boost::signals2::signal< void() > _released_signal;
  boost::signals2::scoped_connection _confirm_subscription;
  boost::signals2::scoped_connection _closed_subscription;
  boost::signals2::scoped_connection _disconnected_subscription;
};

class amqp_channel_factory final: public channel_factory
{
public:
  explicit amqp_channel_factory( amqp_connection& connection );

  std::shared_ptr< channel > create( const exchange_options& options,
                                     topology& topo,
                                     std::shared_ptr< publish_log > log,
                                     strand_type strand ) override;

private:
  amqp_connection& _connection;
};

} // namespace magpie::mq
