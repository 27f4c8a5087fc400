#include <magpie/mq/message_broker.hpp>

#include <koinos/log.hpp>

#include <amqp.h>
#include <amqp_framing.h>
#include <amqp_tcp_socket.h>

#include <cstdio>
#include <mutex>
#include <set>
#include <sstream>
#include <vector>

namespace magpie::mq {

std::string to_string( retry_policy p )
{
  switch( p )
  {
    case retry_policy::none:
      return "none";
    case retry_policy::exponential_backoff:
      return "exponential_backoff";
  }

  return "unknown";
}

std::string to_string( error_code e )
{
  switch( e )
  {
    case error_code::success:
      return "success";
    case error_code::failure:
      return "failure";
    case error_code::rejected:
      return "rejected";
    case error_code::channel_closed:
      return "channel_closed";
  }

  return "unknown";
}

std::string to_string( const message& m )
{
  std::stringstream ss;
  ss << "exchange: " << m.exchange << ", routing_key: " << m.routing_key << ", content_type: " << m.content_type
     << ", size: " << m.data.size();

  if( m.message_id )
    ss << ", message_id: " << *m.message_id;

  if( m.correlation_id )
    ss << ", correlation_id: " << *m.correlation_id;

  if( m.reply_to )
    ss << ", reply_to: " << *m.reply_to;

  if( m.expiration )
    ss << ", expiration: " << *m.expiration;

  return ss.str();
}

namespace detail {

class rabbitmq_broker_impl final
{
public:
  rabbitmq_broker_impl() = default;
  ~rabbitmq_broker_impl();

  error_code connect( const std::string& url, std::chrono::seconds heartbeat ) noexcept;
  void disconnect() noexcept;
  bool connected() noexcept;
  error_code poll() noexcept;

  std::pair< error_code, channel_id > open_channel() noexcept;
  error_code close_channel( channel_id channel ) noexcept;
  error_code confirm_select( channel_id channel ) noexcept;

  error_code declare_exchange( channel_id channel,
                               const std::string& exchange,
                               const std::string& exchange_type,
                               bool passive,
                               bool durable,
                               bool auto_delete,
                               bool internal,
                               const std::map< std::string, std::string >& arguments ) noexcept;

  std::pair< error_code, std::string > declare_queue( channel_id channel,
                                                      const std::string& queue,
                                                      bool passive,
                                                      bool durable,
                                                      bool exclusive,
                                                      bool auto_delete ) noexcept;

  error_code
  bind_queue( channel_id channel, const std::string& queue, const std::string& exchange, const std::string& binding_key ) noexcept;

  std::pair< error_code, delivery_tag > publish( channel_id channel, const message& msg ) noexcept;

  std::vector< publisher_confirm > take_confirms() noexcept;
  std::vector< channel_id > take_closed_channels() noexcept;
  std::optional< std::string > last_error() noexcept;

private:
  void disconnect_lockfree() noexcept;
  error_code check_reply( channel_id channel, amqp_rpc_reply_t r ) noexcept;
  error_code handle_frame( const amqp_frame_t& frame ) noexcept;
  void channel_closed( channel_id channel ) noexcept;
  std::optional< std::string > error_info( amqp_rpc_reply_t r ) noexcept;

  std::mutex _amqp_mutex;
  amqp_connection_state_t _connection = nullptr;
  channel_id _next_channel            = 1;
  std::set< channel_id > _closed_channels;
  std::vector< channel_id > _newly_closed;
  std::map< channel_id, delivery_tag > _next_tags;
  std::vector< publisher_confirm > _confirms;
  std::optional< std::string > _last_error;
};

rabbitmq_broker_impl::~rabbitmq_broker_impl()
{
  disconnect();
}

void rabbitmq_broker_impl::disconnect() noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );
  disconnect_lockfree();
}

void rabbitmq_broker_impl::disconnect_lockfree() noexcept
{
  if( !_connection )
    return;

  amqp_rpc_reply_t r = amqp_connection_close( _connection, AMQP_REPLY_SUCCESS );

  if( r.reply_type != AMQP_RESPONSE_NORMAL )
  {
    LOG( debug ) << "Tried to close connection: " << error_info( r ).value_or( "unknown" );
  }

  int err = amqp_destroy_connection( _connection );

  if( err != AMQP_STATUS_OK )
  {
    LOG( debug ) << "Tried to destroy connection: " << amqp_error_string2( err );
  }

  _connection   = nullptr;
  _next_channel = 1;
  _closed_channels.clear();
  _next_tags.clear();
}

bool rabbitmq_broker_impl::connected() noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );
  return _connection != nullptr;
}

error_code rabbitmq_broker_impl::connect( const std::string& url, std::chrono::seconds heartbeat ) noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  disconnect_lockfree();

  std::vector< char > tmp_url( url.begin(), url.end() );
  tmp_url.push_back( '\0' );

  amqp_connection_info cinfo;
  if( amqp_parse_url( tmp_url.data(), &cinfo ) != AMQP_STATUS_OK )
  {
    _last_error = "unable to parse AMQP url";
    LOG( error ) << "Unable to parse provided AMQP url";
    return error_code::failure;
  }

  _connection          = amqp_new_connection();
  amqp_socket_t* socket = amqp_tcp_socket_new( _connection );

  if( !socket )
  {
    _last_error = "failed to create socket";
    LOG( debug ) << "Failed to create socket";
    disconnect_lockfree();
    return error_code::failure;
  }

  int err = amqp_socket_open( socket, cinfo.host, cinfo.port );

  if( err != AMQP_STATUS_OK )
  {
    _last_error = amqp_error_string2( err );
    LOG( debug ) << "Failed to open socket: " << *_last_error;
    amqp_destroy_connection( _connection );
    _connection = nullptr;
    return error_code::failure;
  }

  std::string vhost = std::string( "/" ) + cinfo.vhost;
  if( vhost.size() > 1 && vhost[ 1 ] == '/' )
    vhost = vhost.substr( 1 );

  amqp_rpc_reply_t r = amqp_login( _connection,
                                   vhost.c_str(),
                                   AMQP_DEFAULT_MAX_CHANNELS,
                                   AMQP_DEFAULT_FRAME_SIZE,
                                   int( heartbeat.count() ),
                                   AMQP_SASL_METHOD_PLAIN,
                                   cinfo.user,
                                   cinfo.password );

  if( r.reply_type != AMQP_RESPONSE_NORMAL )
  {
    _last_error = error_info( r );
    LOG( debug ) << _last_error.value_or( "login failed" );
    disconnect_lockfree();
    return error_code::failure;
  }

  return error_code::success;
}

error_code rabbitmq_broker_impl::poll() noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return error_code::failure;

  amqp_maybe_release_buffers( _connection );

  for( ;; )
  {
    amqp_frame_t frame;
    timeval tv;
    tv.tv_sec  = 0;
    tv.tv_usec = 0;

    int status = amqp_simple_wait_frame_noblock( _connection, &frame, &tv );

    if( status == AMQP_STATUS_TIMEOUT )
      return error_code::success;

    if( status != AMQP_STATUS_OK )
    {
      _last_error = amqp_error_string2( status );
      LOG( debug ) << "Lost connection while polling: " << *_last_error;
      disconnect_lockfree();
      return error_code::failure;
    }

    if( handle_frame( frame ) == error_code::failure )
      return error_code::failure;
  }
}

void rabbitmq_broker_impl::channel_closed( channel_id channel ) noexcept
{
  _closed_channels.insert( channel );
  _newly_closed.push_back( channel );
  _next_tags.erase( channel );
}

error_code rabbitmq_broker_impl::handle_frame( const amqp_frame_t& frame ) noexcept
{
  if( frame.frame_type != AMQP_FRAME_METHOD )
    return error_code::success;

  switch( frame.payload.method.id )
  {
    case AMQP_BASIC_ACK_METHOD:
    {
      auto m = (amqp_basic_ack_t*)frame.payload.method.decoded;
      _confirms.push_back( publisher_confirm{ frame.channel, m->delivery_tag, bool( m->multiple ), true } );
      return error_code::success;
    }
    case AMQP_BASIC_NACK_METHOD:
    {
      auto m = (amqp_basic_nack_t*)frame.payload.method.decoded;
      _confirms.push_back( publisher_confirm{ frame.channel, m->delivery_tag, bool( m->multiple ), false } );
      return error_code::success;
    }
    case AMQP_CHANNEL_CLOSE_METHOD:
    {
      auto m      = (amqp_channel_close_t*)frame.payload.method.decoded;
      _last_error = "server channel error " + std::to_string( m->reply_code ) + ", message: "
                    + std::string( (char*)m->reply_text.bytes, (std::size_t)m->reply_text.len );
      LOG( debug ) << "Channel " << frame.channel << " closed by server: " << *_last_error;

      amqp_channel_close_ok_t close_ok {};
      amqp_send_method( _connection, frame.channel, AMQP_CHANNEL_CLOSE_OK_METHOD, &close_ok );
      channel_closed( frame.channel );
      return error_code::channel_closed;
    }
    case AMQP_CONNECTION_CLOSE_METHOD:
    {
      auto m      = (amqp_connection_close_t*)frame.payload.method.decoded;
      _last_error = "server connection error " + std::to_string( m->reply_code ) + ", message: "
                    + std::string( (char*)m->reply_text.bytes, (std::size_t)m->reply_text.len );
      LOG( debug ) << "Connection closed by server: " << *_last_error;

      amqp_connection_close_ok_t close_ok {};
      amqp_send_method( _connection, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &close_ok );
      amqp_destroy_connection( _connection );
      _connection = nullptr;
      _closed_channels.clear();
      _next_tags.clear();
      return error_code::failure;
    }
    default:
      return error_code::success;
  }
}

std::pair< error_code, channel_id > rabbitmq_broker_impl::open_channel() noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return std::make_pair( error_code::failure, channel_id( 0 ) );

  channel_id channel = _next_channel++;

  amqp_channel_open( _connection, channel );
  auto ec = check_reply( channel, amqp_get_rpc_reply( _connection ) );

  return std::make_pair( ec, channel );
}

error_code rabbitmq_broker_impl::close_channel( channel_id channel ) noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return error_code::failure;

  _next_tags.erase( channel );

  if( _closed_channels.erase( channel ) )
    return error_code::success;

  return check_reply( channel, amqp_channel_close( _connection, channel, AMQP_REPLY_SUCCESS ) );
}

error_code rabbitmq_broker_impl::confirm_select( channel_id channel ) noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return error_code::failure;

  amqp_confirm_select( _connection, channel );
  auto ec = check_reply( channel, amqp_get_rpc_reply( _connection ) );

  // The broker numbers confirms per channel starting at one.
  if( ec == error_code::success )
    _next_tags[ channel ] = 1;

  return ec;
}

error_code rabbitmq_broker_impl::declare_exchange( channel_id channel,
                                                   const std::string& exchange,
                                                   const std::string& exchange_type,
                                                   bool passive,
                                                   bool durable,
                                                   bool auto_delete,
                                                   bool internal,
                                                   const std::map< std::string, std::string >& arguments ) noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return error_code::failure;

  std::vector< amqp_table_entry_t > entries;
  entries.reserve( arguments.size() );

  for( const auto& [ key, value ]: arguments )
  {
    amqp_table_entry_t entry;
    entry.key              = amqp_cstring_bytes( key.c_str() );
    entry.value.kind       = AMQP_FIELD_KIND_UTF8;
    entry.value.value.bytes = amqp_cstring_bytes( value.c_str() );
    entries.push_back( entry );
  }

  amqp_table_t table;
  table.num_entries = int( entries.size() );
  table.entries     = entries.empty() ? nullptr : entries.data();

  amqp_exchange_declare( _connection,
                         channel,
                         amqp_cstring_bytes( exchange.c_str() ),
                         amqp_cstring_bytes( exchange_type.c_str() ),
                         int( passive ),
                         int( durable ),
                         int( auto_delete ),
                         int( internal ),
                         table );

  return check_reply( channel, amqp_get_rpc_reply( _connection ) );
}

std::pair< error_code, std::string > rabbitmq_broker_impl::declare_queue( channel_id channel,
                                                                          const std::string& queue,
                                                                          bool passive,
                                                                          bool durable,
                                                                          bool exclusive,
                                                                          bool auto_delete ) noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return std::make_pair( error_code::failure, "" );

  amqp_queue_declare_ok_t* r = amqp_queue_declare( _connection,
                                                   channel,
                                                   queue.empty() ? amqp_empty_bytes : amqp_cstring_bytes( queue.c_str() ),
                                                   int( passive ),
                                                   int( durable ),
                                                   int( exclusive ),
                                                   int( auto_delete ),
                                                   amqp_empty_table );

  auto ec = check_reply( channel, amqp_get_rpc_reply( _connection ) );
  if( ec != error_code::success )
    return std::make_pair( ec, "" );

  if( queue.empty() )
    return std::make_pair( error_code::success, std::string( (char*)r->queue.bytes, (std::size_t)r->queue.len ) );

  return std::make_pair( error_code::success, queue );
}

error_code rabbitmq_broker_impl::bind_queue( channel_id channel,
                                             const std::string& queue,
                                             const std::string& exchange,
                                             const std::string& binding_key ) noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return error_code::failure;

  amqp_queue_bind( _connection,
                   channel,
                   amqp_cstring_bytes( queue.c_str() ),
                   amqp_cstring_bytes( exchange.c_str() ),
                   amqp_cstring_bytes( binding_key.c_str() ),
                   amqp_empty_table );

  return check_reply( channel, amqp_get_rpc_reply( _connection ) );
}

std::pair< error_code, delivery_tag > rabbitmq_broker_impl::publish( channel_id channel, const message& msg ) noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );

  if( !_connection )
    return std::make_pair( error_code::failure, delivery_tag( 0 ) );

  if( _closed_channels.count( channel ) )
    return std::make_pair( error_code::channel_closed, delivery_tag( 0 ) );

  amqp_basic_properties_t props;
  props._flags        = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
  props.content_type  = amqp_cstring_bytes( msg.content_type.c_str() );
  props.delivery_mode = msg.persistent ? 2 : 1;

  if( msg.message_id.has_value() )
  {
    props._flags     |= AMQP_BASIC_MESSAGE_ID_FLAG;
    props.message_id  = amqp_cstring_bytes( msg.message_id->c_str() );
  }

  if( msg.correlation_id.has_value() )
  {
    props._flags         |= AMQP_BASIC_CORRELATION_ID_FLAG;
    props.correlation_id  = amqp_cstring_bytes( msg.correlation_id->c_str() );
  }

  if( msg.reply_to.has_value() )
  {
    props._flags   |= AMQP_BASIC_REPLY_TO_FLAG;
    props.reply_to  = amqp_cstring_bytes( msg.reply_to->c_str() );
  }

  std::string expiration;
  if( msg.expiration.has_value() )
  {
    expiration        = std::to_string( *msg.expiration );
    props._flags     |= AMQP_BASIC_EXPIRATION_FLAG;
    props.expiration  = amqp_cstring_bytes( expiration.c_str() );
  }

  std::vector< amqp_table_entry_t > headers;
  headers.reserve( msg.headers.size() );
  for( const auto& [ key, value ]: msg.headers )
  {
    amqp_table_entry_t entry;
    entry.key               = amqp_cstring_bytes( key.c_str() );
    entry.value.kind        = AMQP_FIELD_KIND_UTF8;
    entry.value.value.bytes = amqp_cstring_bytes( value.c_str() );
    headers.push_back( entry );
  }

  if( !headers.empty() )
  {
    props._flags               |= AMQP_BASIC_HEADERS_FLAG;
    props.headers.num_entries   = int( headers.size() );
    props.headers.entries       = headers.data();
  }

  amqp_bytes_t data;
  data.bytes = (void*)msg.data.data();
  data.len   = msg.data.size();

  int err = amqp_basic_publish( _connection,
                                channel,
                                amqp_cstring_bytes( msg.exchange.c_str() ),
                                amqp_cstring_bytes( msg.routing_key.c_str() ),
                                0,
                                0,
                                &props,
                                data );

  if( err != AMQP_STATUS_OK )
  {
    _last_error = amqp_error_string2( err );
    LOG( warning ) << "Failed to publish message: " << *_last_error;
    disconnect_lockfree();
    return std::make_pair( error_code::failure, delivery_tag( 0 ) );
  }

  delivery_tag tag = 0;
  if( auto it = _next_tags.find( channel ); it != _next_tags.end() )
    tag = it->second++;

  return std::make_pair( error_code::success, tag );
}

std::vector< publisher_confirm > rabbitmq_broker_impl::take_confirms() noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );
  std::vector< publisher_confirm > confirms;
  confirms.swap( _confirms );
  return confirms;
}

std::vector< channel_id > rabbitmq_broker_impl::take_closed_channels() noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );
  std::vector< channel_id > closed;
  closed.swap( _newly_closed );
  return closed;
}

std::optional< std::string > rabbitmq_broker_impl::last_error() noexcept
{
  std::lock_guard< std::mutex > lock( _amqp_mutex );
  return _last_error;
}

error_code rabbitmq_broker_impl::check_reply( channel_id channel, amqp_rpc_reply_t r ) noexcept
{
  if( r.reply_type == AMQP_RESPONSE_NORMAL )
    return error_code::success;

  _last_error = error_info( r );
  LOG( debug ) << "AMQP reply on channel " << channel << ": " << _last_error.value_or( "unknown" );

  if( r.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION )
  {
    if( r.reply.id == AMQP_CHANNEL_CLOSE_METHOD )
    {
      amqp_channel_close_ok_t close_ok {};
      amqp_send_method( _connection, channel, AMQP_CHANNEL_CLOSE_OK_METHOD, &close_ok );
      channel_closed( channel );
      return error_code::channel_closed;
    }

    if( r.reply.id == AMQP_CONNECTION_CLOSE_METHOD )
    {
      amqp_connection_close_ok_t close_ok {};
      amqp_send_method( _connection, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &close_ok );
      amqp_destroy_connection( _connection );
      _connection = nullptr;
      _closed_channels.clear();
      _next_tags.clear();
    }
  }
  else if( r.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION )
  {
    disconnect_lockfree();
  }

  return error_code::failure;
}

std::optional< std::string > rabbitmq_broker_impl::error_info( amqp_rpc_reply_t r ) noexcept
{
  if( r.reply_type == AMQP_RESPONSE_NONE )
  {
    return "missing RPC reply type";
  }
  else if( r.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION )
  {
    return amqp_error_string2( r.library_error );
  }
  else if( r.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION )
  {
    constexpr std::size_t bufsize = 256;
    char buf[ bufsize ];
    switch( r.reply.id )
    {
      case AMQP_CONNECTION_CLOSE_METHOD:
        {
          amqp_connection_close_t* m = (amqp_connection_close_t*)r.reply.decoded;
          snprintf( buf,
                    bufsize,
                    "server connection error %u, message: %.*s",
                    m->reply_code,
                    (int)m->reply_text.len,
                    (char*)m->reply_text.bytes );
          return buf;
        }
      case AMQP_CHANNEL_CLOSE_METHOD:
        {
          amqp_channel_close_t* m = (amqp_channel_close_t*)r.reply.decoded;
          snprintf( buf,
                    bufsize,
                    "server channel error %u, message: %.*s",
                    m->reply_code,
                    (int)m->reply_text.len,
                    (char*)m->reply_text.bytes );
          return buf;
        }
      default:
        snprintf( buf, bufsize, "unknown server error, method ID 0x%08X", r.reply.id );
        return buf;
    }
  }

  return {};
}

} // namespace detail

rabbitmq_broker::rabbitmq_broker():
    _impl( std::make_unique< detail::rabbitmq_broker_impl >() )
{}

rabbitmq_broker::~rabbitmq_broker() = default;

error_code rabbitmq_broker::connect( const std::string& url, std::chrono::seconds heartbeat ) noexcept
{
  return _impl->connect( url, heartbeat );
}

void rabbitmq_broker::disconnect() noexcept
{
  _impl->disconnect();
}

bool rabbitmq_broker::connected() noexcept
{
  return _impl->connected();
}

error_code rabbitmq_broker::poll() noexcept
{
  return _impl->poll();
}

std::pair< error_code, channel_id > rabbitmq_broker::open_channel() noexcept
{
  return _impl->open_channel();
}

error_code rabbitmq_broker::close_channel( channel_id channel ) noexcept
{
  return _impl->close_channel( channel );
}

error_code rabbitmq_broker::confirm_select( channel_id channel ) noexcept
{
  return _impl->confirm_select( channel );
}

error_code rabbitmq_broker::declare_exchange( channel_id channel,
                                              const std::string& exchange,
                                              const std::string& exchange_type,
                                              bool passive,
                                              bool durable,
                                              bool auto_delete,
                                              bool internal,
                                              const std::map< std::string, std::string >& arguments ) noexcept
{
  return _impl->declare_exchange( channel, exchange, exchange_type, passive, durable, auto_delete, internal, arguments );
}

std::pair< error_code, std::string > rabbitmq_broker::declare_queue( channel_id channel,
                                                                     const std::string& queue,
                                                                     bool passive,
                                                                     bool durable,
                                                                     bool exclusive,
                                                                     bool auto_delete ) noexcept
{
  return _impl->declare_queue( channel, queue, passive, durable, exclusive, auto_delete );
}

error_code rabbitmq_broker::bind_queue( channel_id channel,
                                        const std::string& queue,
                                        const std::string& exchange,
                                        const std::string& binding_key ) noexcept
{
  return _impl->bind_queue( channel, queue, exchange, binding_key );
}

std::pair< error_code, delivery_tag > rabbitmq_broker::publish( channel_id channel, const message& msg ) noexcept
{
  return _impl->publish( channel, msg );
}

std::vector< publisher_confirm > rabbitmq_broker::take_confirms() noexcept
{
  return _impl->take_confirms();
}

std::vector< channel_id > rabbitmq_broker::take_closed_channels() noexcept
{
  return _impl->take_closed_channels();
}

std::optional< std::string > rabbitmq_broker::last_error() noexcept
{
  return _impl->last_error();
}

} // namespace magpie::mq
