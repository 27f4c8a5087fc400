#include <magpie/mq/amqp_channel.hpp>
#include <magpie/mq/exception.hpp>

#include <koinos/log.hpp>

#include <boost/asio/post.hpp>

#include <iterator>
#include <vector>

namespace magpie::mq {

amqp_channel::amqp_channel( strand_type strand,
                            amqp_connection& connection,
                            const exchange_options& options,
                            topology& topo,
                            std::shared_ptr< publish_log > log ):
    _strand( std::move( strand ) ),
    _connection( connection ),
    _broker( connection.broker() ),
    _options( options ),
    _topology( topo ),
    _log( std::move( log ) )
{}

amqp_channel::~amqp_channel() = default;

void amqp_channel::listen()
{
  std::weak_ptr< amqp_channel > weak = weak_from_this();

  _confirm_subscription = _connection.on_confirm(
    [ weak ]( const publisher_confirm& confirm )
    {
      if( auto self = weak.lock() )
      {
        boost::asio::post( self->_strand,
                           [ self, confirm ]()
                           {
                             self->handle_confirm( confirm );
                           } );
      }
    } );

  _closed_subscription = _connection.on_channel_closed(
    [ weak ]( channel_id id )
    {
      if( auto self = weak.lock() )
      {
        boost::asio::post( self->_strand,
                           [ self, id ]()
                           {
                             if( self->_channel != 0 && id == self->_channel )
                               self->handle_channel_closed();
                           } );
      }
    } );

  _disconnected_subscription = _connection.on_disconnected(
    [ weak ]()
    {
      if( auto self = weak.lock() )
      {
        boost::asio::post( self->_strand,
                           [ self ]()
                           {
                             self->handle_disconnected();
                           } );
      }
    } );
}

boost::signals2::connection amqp_channel::on_released( const std::function< void() >& slot )
{
  return _released_signal.connect( slot );
}

std::size_t amqp_channel::outstanding() const
{
  return _pending.size();
}

void amqp_channel::release()
{
  if( _released )
    return;

  _released = true;
  LOG( warning ) << "Channel for exchange " << _options.name << " was released by the broker";
  _released_signal();
}

std::string amqp_channel::describe_error( error_code ec ) const
{
  return _broker->last_error().value_or( to_string( ec ) );
}

void amqp_channel::fail_pending( std::exception_ptr e )
{
  auto pending = std::move( _pending );
  _pending.clear();

  for( auto& entry: pending )
    entry.second.handler( e );
}

void amqp_channel::handle_confirm( const publisher_confirm& confirm )
{
  if( _channel == 0 || confirm.channel != _channel )
    return;

  auto first = _pending.begin();
  auto last  = _pending.upper_bound( confirm.tag );

  if( !confirm.multiple )
  {
    first = _pending.find( confirm.tag );
    if( first == _pending.end() )
    {
      LOG( debug ) << "Ignoring confirm for unknown delivery tag " << confirm.tag << " on exchange " << _options.name;
      return;
    }

    last = std::next( first );
  }

  std::vector< pending_publish > settled;
  for( auto it = first; it != last; ++it )
    settled.push_back( std::move( it->second ) );

  _pending.erase( first, last );

  for( auto& p: settled )
  {
    _log->confirm( p.seq );

    if( confirm.ack )
      p.handler( nullptr );
    else
      p.handler(
        std::make_exception_ptr( publish_rejected_error( "broker rejected message on exchange " + _options.name ) ) );
  }
}

void amqp_channel::handle_channel_closed()
{
  release();

  if( !_pending.empty() )
  {
    LOG( debug ) << "Channel for exchange " << _options.name << " closed with " << _pending.size()
                 << " publishes unconfirmed";

    fail_pending( std::make_exception_ptr(
      channel_released( "channel closed before the broker confirmed a publish to " + _options.name ) ) );
  }

  _channel = 0;
}

void amqp_channel::handle_disconnected()
{
  if( _channel == 0 )
    return;

  _channel = 0;

  fail_pending( std::make_exception_ptr(
    publish_error( "connection lost before the broker confirmed a publish to " + _options.name ) ) );
}

void amqp_channel::define( completion_handler handler )
{
  boost::asio::post( _strand,
                     [ self = shared_from_this(), handler ]()
                     {
                       auto [ ec, channel ] = self->_broker->open_channel();

                       if( ec == error_code::success )
                       {
                         self->_channel = channel;
                         ec             = self->_broker->confirm_select( channel );
                       }

                       if( ec == error_code::success )
                       {
                         const auto& o = self->_options;
                         ec            = self->_broker->declare_exchange( channel,
                                                               o.name,
                                                               o.type,
                                                               false,
                                                               o.durable,
                                                               o.auto_delete,
                                                               o.internal,
                                                               declare_arguments( o ) );
                       }

                       if( ec != error_code::success )
                       {
                         handler( std::make_exception_ptr( exchange_definition_error(
                           "failed to define " + self->_options.type + " exchange " + self->_options.name + ": "
                           + self->describe_error( ec ) ) ) );
                         return;
                       }

                       self->_topology.exchange_defined( self->_options );
                       handler( nullptr );
                     } );
}

void amqp_channel::publish( const message& msg, completion_handler handler )
{
  boost::asio::post( _strand,
                     [ self = shared_from_this(), msg, handler ]() mutable
                     {
                       // Nothing reaches the broker, so there is nothing to replay later.
                       if( !self->_broker->connected() )
                       {
                         handler( std::make_exception_ptr( connection_not_connected(
                           "cannot publish to " + self->_options.name + " while disconnected" ) ) );
                         return;
                       }

                       if( self->_released || self->_channel == 0 )
                       {
                         handler( std::make_exception_ptr(
                           channel_released( "channel for exchange " + self->_options.name + " is not open" ) ) );
                         return;
                       }

                       msg.exchange     = self->_options.name;
                       auto seq         = self->_log->append( msg );
                       auto [ ec, tag ] = self->_broker->publish( self->_channel, msg );

                       switch( ec )
                       {
                         case error_code::success:
                           if( tag == 0 )
                           {
                             // Not in confirm mode, the write is all the broker will tell us.
                             self->_log->confirm( seq );
                             handler( nullptr );
                           }
                           else
                           {
                             self->_pending.emplace( tag, pending_publish{ seq, handler } );
                           }
                           break;
                         case error_code::channel_closed:
                           self->_log->confirm( seq );
                           self->release();
                           handler( std::make_exception_ptr( channel_released(
                             "channel closed while publishing to " + self->_options.name + ": "
                             + self->describe_error( ec ) ) ) );
                           break;
                         default:
                           LOG( warning ) << "Failed to publish " << to_string( msg ) << ": "
                                          << self->describe_error( ec );
                           handler( std::make_exception_ptr( publish_error(
                             "failed to publish to " + self->_options.name + ": " + self->describe_error( ec ) ) ) );
                           break;
                       }
                     } );
}

void amqp_channel::destroy( completion_handler handler )
{
  boost::asio::post( _strand,
                     [ self = shared_from_this(), handler ]()
                     {
                       if( self->_channel != 0 && !self->_released && self->_broker->connected() )
                       {
                         auto ec = self->_broker->close_channel( self->_channel );
                         if( ec != error_code::success )
                           LOG( debug ) << "Tried to close channel for exchange " << self->_options.name << ": "
                                        << self->describe_error( ec );
                       }

                       self->_channel = 0;
                       self->fail_pending( std::make_exception_ptr(
                         channel_released( "channel for exchange " + self->_options.name + " was destroyed" ) ) );

                       self->_confirm_subscription.disconnect();
                       self->_closed_subscription.disconnect();
                       self->_disconnected_subscription.disconnect();
                       handler( nullptr );
                     } );
}

amqp_channel_factory::amqp_channel_factory( amqp_connection& connection ):
    _connection( connection )
{}

std::shared_ptr< channel > amqp_channel_factory::create( const exchange_options& options,
                                                         topology& topo,
                                                         std::shared_ptr< publish_log > log,
                                                         strand_type strand )
{
  auto ch = std::make_shared< amqp_channel >( std::move( strand ), _connection, options, topo, std::move( log ) );
  ch->listen();
  return ch;
}

} // namespace magpie::mq
