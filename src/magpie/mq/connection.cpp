#include <magpie/mq/connection.hpp>
#include <magpie/mq/exception.hpp>

#include <koinos/log.hpp>

namespace magpie::mq {

amqp_connection::amqp_connection( boost::asio::io_context& ioc,
                                  connection_options options,
                                  std::shared_ptr< message_broker > broker ):
    _options( std::move( options ) ),
    _broker( std::move( broker ) ),
    _retryer( ioc, _options.max_retry_delay ),
    _poll_timer( ioc )
{
  KOINOS_ASSERT( _broker, connection_failure, "connection ${n} requires a broker", ( "n", _options.name ) );
}

amqp_connection::~amqp_connection()
{
  _retryer.cancel();
  _poll_timer.cancel();
}

void amqp_connection::connect( connect_func on_connect, retry_policy policy )
{
  KOINOS_ASSERT( !connected(), connection_failure, "connection ${n} is already connected", ( "n", _options.name ) );

  _running = true;

  LOG( info ) << "Connecting " << _options.name << " to AMQP server";

  _retryer.with_policy(
    policy,
    [ this ]() -> error_code
    {
      return _broker->connect( _options.url, _options.heartbeat );
    },
    "connection " + _options.name + " to AMQP",
    [ this, on_connect ]( error_code ec )
    {
      if( ec == error_code::success )
      {
        LOG( info ) << "Established AMQP connection " << _options.name;
        schedule_poll();
      }
      else
      {
        LOG( error ) << "Could not connect " << _options.name << " to AMQP server";
        _running = false;
      }

      on_connect( ec );
    },
    _options.retry_delay );
}

void amqp_connection::disconnect()
{
  _running = false;
  _retryer.cancel();
  _poll_timer.cancel();

  if( _broker->connected() )
  {
    _broker->disconnect();
    _disconnected();
  }
}

bool amqp_connection::connected() const
{
  return _broker->connected();
}

const std::string& amqp_connection::name() const
{
  return _options.name;
}

std::chrono::milliseconds amqp_connection::publish_timeout() const
{
  return _options.publish_timeout;
}

boost::signals2::connection amqp_connection::on_reconnected( const std::function< void() >& slot )
{
  return _reconnected.connect( slot );
}

boost::signals2::connection
amqp_connection::on_confirm( const std::function< void( const publisher_confirm& ) >& slot )
{
  return _confirmed.connect( slot );
}

boost::signals2::connection amqp_connection::on_channel_closed( const std::function< void( channel_id ) >& slot )
{
  return _channel_closed.connect( slot );
}

boost::signals2::connection amqp_connection::on_disconnected( const std::function< void() >& slot )
{
  return _disconnected.connect( slot );
}

std::shared_ptr< message_broker > amqp_connection::broker() const
{
  return _broker;
}

void amqp_connection::schedule_poll()
{
  if( !_running )
    return;

  _poll_timer.expires_after( _options.poll_interval );
  _poll_timer.async_wait(
    [ this ]( const boost::system::error_code& ec )
    {
      poll( ec );
    } );
}

void amqp_connection::poll( const boost::system::error_code& ec )
{
  if( ec == boost::asio::error::operation_aborted || !_running )
    return;

  auto result = _broker->poll();

  // Confirms read before a failure still settle their messages.
  for( const auto& confirm: _broker->take_confirms() )
    _confirmed( confirm );

  for( auto channel: _broker->take_closed_channels() )
    _channel_closed( channel );

  if( result != error_code::success )
  {
    LOG( warning ) << "Lost AMQP connection " << _options.name << ", attempting to reconnect...";
    _disconnected();
    reconnect();
    return;
  }

  schedule_poll();
}

void amqp_connection::reconnect()
{
  if( _reconnecting )
    return;

  _reconnecting = true;

  _retryer.with_policy(
    retry_policy::exponential_backoff,
    [ this ]() -> error_code
    {
      return _broker->connect( _options.url, _options.heartbeat );
    },
    "reconnection of " + _options.name + " to AMQP",
    [ this ]( error_code ec )
    {
      _reconnecting = false;

      if( ec != error_code::success )
      {
        LOG( error ) << "Gave up reconnecting " << _options.name << " to AMQP server";
        return;
      }

      LOG( info ) << "Reestablished AMQP connection " << _options.name;
      schedule_poll();
      _reconnected();
    },
    _options.retry_delay );
}

} // namespace magpie::mq
