#include <magpie/mq/topology.hpp>

#include <koinos/log.hpp>

#include <boost/asio/post.hpp>

#include <tuple>

namespace magpie::mq {

amqp_topology::amqp_topology( boost::asio::io_context& ioc, amqp_connection& connection ):
    _ioc( ioc ),
    _connection( connection )
{
  _reconnected_subscription = _connection.on_reconnected(
    [ this ]()
    {
      boost::asio::post( _ioc,
                         [ this ]()
                         {
                           configure();
                         } );
    } );
}

amqp_topology::~amqp_topology() = default;

void amqp_topology::add_exchange( const exchange_options& options )
{
  _exchanges[ options.name ] = options;
}

void amqp_topology::add_queue( const queue_options& options )
{
  _queues.push_back( options );
}

void amqp_topology::add_binding( const binding& b )
{
  _bindings.push_back( b );
}

void amqp_topology::exchange_defined( const exchange_options& options )
{
  add_exchange( options );
}

boost::signals2::connection amqp_topology::on_bindings_completed( const std::function< void() >& slot )
{
  return _bindings_completed.connect( slot );
}

error_code amqp_topology::configure()
{
  auto broker = _connection.broker();

  auto [ ec, channel ] = broker->open_channel();
  if( ec != error_code::success )
  {
    LOG( error ) << "Could not open a channel to configure topology on " << _connection.name();
    return ec;
  }

  ec = assert_topology( channel );
  broker->close_channel( channel );

  if( ec != error_code::success )
  {
    LOG( error ) << "Failed to configure topology on " << _connection.name() << ": "
                 << broker->last_error().value_or( to_string( ec ) );
    return ec;
  }

  LOG( debug ) << "Bindings completed on " << _connection.name() << " (" << _bindings.size() << " bindings)";
  _bindings_completed();

  return error_code::success;
}

error_code amqp_topology::assert_topology( channel_id channel )
{
  auto broker = _connection.broker();
  error_code ec;

  for( const auto& [ name, options ]: _exchanges )
  {
    LOG( debug ) << "Asserting exchange " << name;
    ec = broker->declare_exchange( channel,
                                   options.name,
                                   options.type,
                                   false,
                                   options.durable,
                                   options.auto_delete,
                                   options.internal,
                                   declare_arguments( options ) );

    if( ec != error_code::success )
      return ec;
  }

  for( const auto& q: _queues )
  {
    LOG( debug ) << "Asserting queue " << q.name;
    std::tie( ec, std::ignore ) = broker->declare_queue( channel, q.name, false, q.durable, q.exclusive, q.auto_delete );

    if( ec != error_code::success )
      return ec;
  }

  for( const auto& b: _bindings )
  {
    LOG( info ) << "Binding \"" << b.exchange << "\" to \"" << b.queue << "\" with pattern \"" << b.pattern << "\"";
    ec = broker->bind_queue( channel, b.queue, b.exchange, b.pattern );

    if( ec != error_code::success )
      return ec;
  }

  return error_code::success;
}

} // namespace magpie::mq
