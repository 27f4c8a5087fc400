#pragma once

#include <boost/core/noncopyable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace magpie::mq {

enum class retry_policy
{
  none,
  exponential_backoff
};

enum class error_code : int64_t
{
  success,
  failure,
  rejected,
  channel_closed
};

using channel_id = uint16_t;

struct message
{
  std::string exchange;
  std::string routing_key;
  std::string content_type = "application/octet-stream";
  std::string data;
  bool persistent = true;
  std::optional< std::string > message_id;
  std::optional< std::string > correlation_id;
  std::optional< std::string > reply_to;
  std::optional< uint64_t > expiration;
  std::map< std::string, std::string > headers;
};

std::string to_string( retry_policy p );
std::string to_string( error_code e );
std::string to_string( const message& m );

using delivery_tag = uint64_t;

// A basic.ack or basic.nack read from the broker for a channel in confirm mode.
struct publisher_confirm
{
  channel_id channel = 0;
  delivery_tag tag   = 0;
  bool multiple      = false;
  bool ack           = true;
};

/**
 * Synchronous, noexcept access to one broker connection with numbered
 * channels.
 *
 * publish() only sends. Once a channel is in confirm mode every publish on it
 * gets the next delivery tag, and the broker's acks and nacks are collected by
 * poll() and handed out by take_confirms().
 */
class message_broker: private boost::noncopyable
{
public:
  virtual ~message_broker() = default;

  virtual error_code connect( const std::string& url, std::chrono::seconds heartbeat ) noexcept = 0;
  virtual void disconnect() noexcept = 0;
  virtual bool connected() noexcept = 0;

  // Reads any pending frames without blocking. Returns failure if the socket is gone.
  virtual error_code poll() noexcept = 0;

  virtual std::pair< error_code, channel_id > open_channel() noexcept = 0;
  virtual error_code close_channel( channel_id channel ) noexcept = 0;
  virtual error_code confirm_select( channel_id channel ) noexcept = 0;

  virtual error_code declare_exchange( channel_id channel,
                                       const std::string& exchange,
                                       const std::string& exchange_type,
                                       bool passive,
                                       bool durable,
                                       bool auto_delete,
                                       bool internal,
                                       const std::map< std::string, std::string >& arguments ) noexcept = 0;

  virtual std::pair< error_code, std::string > declare_queue( channel_id channel,
                                                              const std::string& queue,
                                                              bool passive,
                                                              bool durable,
                                                              bool exclusive,
                                                              bool auto_delete ) noexcept = 0;

  virtual error_code bind_queue( channel_id channel,
                                 const std::string& queue,
                                 const std::string& exchange,
                                 const std::string& binding_key ) noexcept = 0;

  virtual std::pair< error_code, delivery_tag > publish( channel_id channel, const message& msg ) noexcept = 0;

  // Confirms read since the last call, in arrival order.
  virtual std::vector< publisher_confirm > take_confirms() noexcept = 0;

  // Channels closed by the server since the last call.
  virtual std::vector< channel_id > take_closed_channels() noexcept = 0;

  virtual std::optional< std::string > last_error() noexcept = 0;
};

namespace detail {
class rabbitmq_broker_impl;
} // namespace detail

// message_broker over a single rabbitmq-c connection.
class rabbitmq_broker final: public message_broker
{
public:
  rabbitmq_broker();
  ~rabbitmq_broker() override;

  error_code connect( const std::string& url, std::chrono::seconds heartbeat ) noexcept override;
  void disconnect() noexcept override;
  bool connected() noexcept override;
  error_code poll() noexcept override;

  std::pair< error_code, channel_id > open_channel() noexcept override;
  error_code close_channel( channel_id channel ) noexcept override;
  error_code confirm_select( channel_id channel ) noexcept override;

  error_code declare_exchange( channel_id channel,
                               const std::string& exchange,
                               const std::string& exchange_type,
                               bool passive,
                               bool durable,
                               bool auto_delete,
                               bool internal,
                               const std::map< std::string, std::string >& arguments ) noexcept override;

  std::pair< error_code, std::string > declare_queue( channel_id channel,
                                                      const std::string& queue,
                                                      bool passive,
                                                      bool durable,
                                                      bool exclusive,
                                                      bool auto_delete ) noexcept override;

  error_code bind_queue( channel_id channel,
                         const std::string& queue,
                         const std::string& exchange,
                         const std::string& binding_key ) noexcept override;

  std::pair< error_code, delivery_tag > publish( channel_id channel, const message& msg ) noexcept override;

  std::vector< publisher_confirm > take_confirms() noexcept override;
  std::vector< channel_id > take_closed_channels() noexcept override;

  std::optional< std::string > last_error() noexcept override;

private:
  std::unique_ptr< detail::rabbitmq_broker_impl > _impl;
};

} // namespace magpie::mq
