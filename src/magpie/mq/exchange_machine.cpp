#include <magpie/mq/exception.hpp>
#include <magpie/mq/exchange_machine.hpp>

#include <koinos/log.hpp>

#include <boost/asio/post.hpp>

#include <algorithm>

namespace magpie::mq {

namespace {

std::string describe( std::exception_ptr e )
{
  if( !e )
    return "unknown error";

  try
  {
    std::rethrow_exception( e );
  }
  catch( const std::exception& ex )
  {
    return ex.what();
  }
  catch( ... )
  {
    return "unknown error";
  }
}

} // namespace

std::string to_string( exchange_state s )
{
  switch( s )
  {
    case exchange_state::setup:
      return "setup";
    case exchange_state::initializing:
      return "initializing";
    case exchange_state::ready:
      return "ready";
    case exchange_state::failed:
      return "failed";
    case exchange_state::reconnecting:
      return "reconnecting";
    case exchange_state::reconnected:
      return "reconnected";
    case exchange_state::destroyed:
      return "destroyed";
  }

  return "unknown";
}

std::shared_ptr< exchange_machine > exchange_machine::create( boost::asio::io_context& ioc,
                                                              const exchange_options& options,
                                                              broker_connection& connection,
                                                              topology& topo,
                                                              std::shared_ptr< channel_factory > factory )
{
  KOINOS_ASSERT( factory, mq_exception, "exchange ${n} requires a channel factory", ( "n", options.name ) );

  std::shared_ptr< exchange_machine > machine(
    new exchange_machine( ioc, options, connection, topo, std::move( factory ) ) );

  boost::asio::post( machine->_strand,
                     [ machine ]()
                     {
                       machine->start();
                     } );

  return machine;
}

exchange_machine::exchange_machine( boost::asio::io_context& ioc,
                                    const exchange_options& options,
                                    broker_connection& connection,
                                    topology& topo,
                                    std::shared_ptr< channel_factory > factory ):
    _strand( boost::asio::make_strand( ioc ) ),
    _options( options ),
    _connection( connection ),
    _topology( topo ),
    _factory( std::move( factory ) ),
    _published( std::make_shared< publish_log >() )
{
  _transition.connect(
    [ name = _options.name ]( exchange_state from, exchange_state to )
    {
      LOG( debug ) << "Machine exchange-" << name << ": " << to_string( from ) << " -> " << to_string( to );
    } );
}

exchange_machine::~exchange_machine()
{
  stop_listening();
  _deferred.reject_all( std::make_exception_ptr( mq_exception( "exchange " + _options.name + " was dropped" ) ) );
}

const std::string& exchange_machine::name() const
{
  return _options.name;
}

const std::string& exchange_machine::type() const
{
  return _options.type;
}

exchange_state exchange_machine::state() const
{
  return _state;
}

std::size_t exchange_machine::unconfirmed() const
{
  return _published->count();
}

boost::signals2::connection exchange_machine::on_defined( const defined_func& slot )
{
  return _defined.connect( slot );
}

boost::signals2::connection exchange_machine::on_failed( const failed_func& slot )
{
  return _failed.connect( slot );
}

boost::signals2::connection exchange_machine::on_destroyed( const destroyed_func& slot )
{
  return _destroyed.connect( slot );
}

boost::signals2::connection exchange_machine::on_transition( const transition_func& slot )
{
  return _transition.connect( slot );
}

std::shared_future< void > exchange_machine::publish( const message& msg,
                                                      std::optional< std::chrono::milliseconds > timeout )
{
  auto r        = std::make_shared< publish_request >();
  r->msg        = msg;
  r->completion = std::make_shared< deferred_completion >();

  auto fut = r->completion->future();

  boost::asio::post( _strand,
                     [ self = shared_from_this(), r, timeout ]()
                     {
                       LOG( trace ) << "Publish called in state " << to_string( self->_state );

                       self->_deferred.add( r->completion );

                       auto t = self->resolve_publish_timeout( timeout );
                       if( t.count() > 0 )
                         self->start_publish_timer( r, t );

                       self->handle_publish( r );
                     } );

  return fut;
}

std::shared_future< void > exchange_machine::check()
{
  auto c   = std::make_shared< deferred_completion >();
  auto fut = c->future();

  boost::asio::post( _strand,
                     [ self = shared_from_this(), c ]()
                     {
                       self->_deferred.add( c );
                       self->handle_check( c );
                     } );

  return fut;
}

std::shared_future< void > exchange_machine::destroy()
{
  auto c   = std::make_shared< deferred_completion >();
  auto fut = c->future();

  boost::asio::post( _strand,
                     [ self = shared_from_this(), c ]()
                     {
                       LOG( debug ) << "Destroy called on exchange " << self->_options.name << " - "
                                    << self->_connection.name() << " (" << self->_published->count()
                                    << " messages pending)";

                       self->_deferred.add( c );
                       self->handle_destroy( c );
                     } );

  return fut;
}

void exchange_machine::start()
{
  enter_state( exchange_state::setup );
}

void exchange_machine::listen_for_connection_events()
{
  if( !_handlers.empty() )
    return;

  std::weak_ptr< exchange_machine > weak = weak_from_this();

  _handlers.push_back( _topology.on_bindings_completed(
    [ weak ]()
    {
      if( auto self = weak.lock() )
      {
        boost::asio::post( self->_strand,
                           [ self ]()
                           {
                             if( !self->_handlers.empty() )
                               self->handle_bindings_completed();
                           } );
      }
    } ) );

  _handlers.push_back( _connection.on_reconnected(
    [ weak ]()
    {
      if( auto self = weak.lock() )
      {
        boost::asio::post( self->_strand,
                           [ self ]()
                           {
                             if( !self->_handlers.empty() )
                               self->transition( exchange_state::reconnecting );
                           } );
      }
    } ) );
}

void exchange_machine::stop_listening()
{
  for( auto& handler: _handlers )
    handler.disconnect();

  _handlers.clear();
}

void exchange_machine::transition( exchange_state to )
{
  exchange_state from = _state;
  _state              = to;

  _transition( from, to );
  enter_state( to );

  // The on-enter action may already have moved the machine on.
  if( _state == to )
    drain_deferred( to );
}

void exchange_machine::enter_state( exchange_state s )
{
  switch( s )
  {
    case exchange_state::setup:
      listen_for_connection_events();
      transition( exchange_state::initializing );
      break;
    case exchange_state::initializing:
      create_channel();
      define( exchange_state::ready );
      break;
    case exchange_state::reconnecting:
      listen_for_connection_events();
      create_channel();
      define( exchange_state::reconnected );
      break;
    case exchange_state::ready:
    case exchange_state::reconnected:
      _defined();
      break;
    case exchange_state::failed:
      {
        _failed( _failed_with );
        auto rejected = _deferred.reject_all( _failed_with );
        if( rejected )
          LOG( debug ) << "Rejected " << rejected << " pending calls on exchange " << _options.name;

        drop_settled();

        _released_handler.disconnect();
        _channel.reset();
        _generation++;
        break;
      }
    case exchange_state::destroyed:
      teardown();
      break;
  }
}

void exchange_machine::defer_until( exchange_state s, deferred_completion_ptr completion, operation op )
{
  _deferred_ops[ s ].push_back( deferred_operation{ std::move( completion ), std::move( op ) } );
}

void exchange_machine::drop_settled()
{
  for( auto& [ state, ops ]: _deferred_ops )
  {
    ops.erase( std::remove_if( ops.begin(),
                               ops.end(),
                               []( const deferred_operation& d )
                               {
                                 return d.completion && d.completion->settled();
                               } ),
               ops.end() );
  }
}

void exchange_machine::drain_deferred( exchange_state s )
{
  auto it = _deferred_ops.find( s );
  if( it == _deferred_ops.end() || it->second.empty() )
    return;

  std::deque< deferred_operation > ops;
  ops.swap( it->second );

  for( auto& d: ops )
    d.op();
}

completion_handler exchange_machine::on_strand( completion_handler h )
{
  // Handlers capture the machine by pointer, the posted call keeps it alive while one runs.
  return [ weak = weak_from_this(), h ]( std::exception_ptr e )
  {
    if( auto self = weak.lock() )
    {
      boost::asio::post( self->_strand,
                         [ self, h, e ]()
                         {
                           h( e );
                         } );
    }
  };
}

void exchange_machine::create_channel()
{
  _generation++;
  _channel = _factory->create( _options, _topology, _published, _strand );

  std::weak_ptr< exchange_machine > weak = weak_from_this();
  auto generation                        = _generation;

  _released_handler = _channel->on_released(
    [ weak, generation ]()
    {
      if( auto self = weak.lock() )
      {
        boost::asio::post( self->_strand,
                           [ self, generation ]()
                           {
                             if( generation == self->_generation )
                               self->handle_released();
                           } );
      }
    } );
}

void exchange_machine::define( exchange_state on_defined )
{
  auto generation = _generation;

  _channel->define( on_strand(
    [ this, generation, on_defined ]( std::exception_ptr e )
    {
      if( generation != _generation )
      {
        LOG( debug ) << "Ignoring definition result from a replaced channel on exchange " << _options.name;
        return;
      }

      if( e )
      {
        LOG( error ) << "Failed to define " << _options.type << " exchange " << _options.name << " - "
                     << _connection.name() << ": " << describe( e );
        _failed_with = e;
        transition( exchange_state::failed );
        return;
      }

      transition( on_defined );
    } ) );
}

void exchange_machine::republish()
{
  auto undelivered = _published->reset();

  if( undelivered.empty() )
  {
    transition( exchange_state::ready );
    return;
  }

  LOG( info ) << "Republishing " << undelivered.size() << " unconfirmed messages on " << _options.type << " exchange "
              << _options.name << " - " << _connection.name();

  auto generation  = _generation;
  auto remaining   = std::make_shared< std::size_t >( undelivered.size() );
  auto failures    = std::make_shared< std::size_t >( 0 );
  auto first_error = std::make_shared< std::exception_ptr >();

  for( const auto& msg: undelivered )
  {
    _channel->publish( msg,
                       on_strand(
                         [ this, generation, remaining, failures, first_error ]( std::exception_ptr e )
                         {
                           if( e )
                           {
                             ( *failures )++;
                             if( !*first_error )
                               *first_error = e;
                           }

                           if( --( *remaining ) > 0 )
                             return;

                           if( *failures )
                           {
                             LOG( error ) << "Failed to republish " << *failures << " messages on " << _options.type
                                          << " exchange, " << _options.name << " - " << _connection.name() << ": "
                                          << describe( *first_error );
                           }

                           if( generation != _generation || _state != exchange_state::reconnected )
                             return;

                           // Messages that failed to replay are dropped, not retried. The exchange stays available.
                           if( *failures )
                             _published->reset();

                           transition( exchange_state::ready );
                         } ) );
  }
}

void exchange_machine::teardown()
{
  if( auto pending = _published->reset(); !pending.empty() )
  {
    LOG( warning ) << _options.type << " exchange " << _options.name << " - " << _connection.name()
                   << " was destroyed with " << pending.size() << " messages unconfirmed";
  }

  stop_listening();
  _released_handler.disconnect();

  auto ch = _channel;
  if( !ch )
  {
    _destroyed();
    return;
  }

  _tearing_down = true;

  ch->destroy( on_strand(
    [ this, ch ]( std::exception_ptr e )
    {
      if( e )
        LOG( warning ) << "Error while destroying channel for exchange " << _options.name << ": " << describe( e );

      if( _channel == ch )
        _channel.reset();

      _tearing_down = false;
      _destroyed();

      std::vector< deferred_completion_ptr > waiters;
      waiters.swap( _teardown_waiters );

      for( auto& w: waiters )
        _deferred.resolve( w );
    } ) );
}

void exchange_machine::handle_publish( const publish_request_ptr& r )
{
  if( r->completion->settled() )
    return;

  switch( _state )
  {
    case exchange_state::ready:
      execute_publish( r );
      break;
    case exchange_state::failed:
      LOG( debug ) << "Publish on failed exchange " << _options.name << ": " << describe( _failed_with );
      _deferred.reject( r->completion, _failed_with );
      _failed( _failed_with );
      break;
    case exchange_state::destroyed:
      transition( exchange_state::reconnecting );
      defer_until( exchange_state::ready,
                   r->completion,
                   [ this, r ]()
                   {
                     handle_publish( r );
                   } );
      break;
    default:
      defer_until( exchange_state::ready,
                   r->completion,
                   [ this, r ]()
                   {
                     handle_publish( r );
                   } );
      break;
  }
}

void exchange_machine::handle_check( const deferred_completion_ptr& c )
{
  if( c->settled() )
    return;

  switch( _state )
  {
    case exchange_state::ready:
      _deferred.resolve( c );
      _defined();
      break;
    case exchange_state::failed:
      _deferred.reject( c, _failed_with );
      _failed( _failed_with );
      break;
    default:
      defer_until( exchange_state::ready,
                   c,
                   [ this, c ]()
                   {
                     handle_check( c );
                   } );
      break;
  }
}

void exchange_machine::handle_destroy( const deferred_completion_ptr& c )
{
  if( c->settled() )
    return;

  switch( _state )
  {
    case exchange_state::ready:
      defer_until( exchange_state::destroyed,
                   c,
                   [ this, c ]()
                   {
                     handle_destroy( c );
                   } );
      transition( exchange_state::destroyed );
      break;
    case exchange_state::destroyed:
      if( _tearing_down )
      {
        _teardown_waiters.push_back( c );
      }
      else
      {
        _deferred.resolve( c );
        _destroyed();
      }
      break;
    default:
      defer_until( exchange_state::ready,
                   c,
                   [ this, c ]()
                   {
                     handle_destroy( c );
                   } );
      break;
  }
}

void exchange_machine::handle_released()
{
  switch( _state )
  {
    case exchange_state::initializing:
    case exchange_state::ready:
    case exchange_state::reconnected:
      LOG( warning ) << "Channel for " << _options.type << " exchange " << _options.name << " - " << _connection.name()
                     << " was released, redefining";
      transition( exchange_state::initializing );
      break;
    default:
      LOG( debug ) << "Ignoring channel release on exchange " << _options.name << " in state " << to_string( _state );
      break;
  }
}

void exchange_machine::handle_bindings_completed()
{
  switch( _state )
  {
    case exchange_state::reconnected:
      republish();
      break;
    case exchange_state::reconnecting:
    case exchange_state::destroyed:
      defer_until( exchange_state::reconnected,
                   nullptr,
                   [ this ]()
                   {
                     handle_bindings_completed();
                   } );
      break;
    default:
      LOG( trace ) << "Bindings completed on exchange " << _options.name << " in state " << to_string( _state );
      break;
  }
}

void exchange_machine::execute_publish( const publish_request_ptr& r )
{
  _channel->publish( r->msg,
                     on_strand(
                       [ this, r ]( std::exception_ptr e )
                       {
                         settle_publish( r, e );
                       } ) );
}

void exchange_machine::start_publish_timer( const publish_request_ptr& r, std::chrono::milliseconds timeout )
{
  r->timer = std::make_unique< boost::asio::steady_timer >( _strand );
  r->timer->expires_after( timeout );
  r->timer->async_wait(
    [ self = shared_from_this(), r ]( const boost::system::error_code& ec )
    {
      if( ec == boost::asio::error::operation_aborted )
        return;

      if( self->_deferred.reject( r->completion,
                                  std::make_exception_ptr(
                                    publish_timeout_error( "publish took longer than configured timeout" ) ) ) )
        LOG( debug ) << "Publish to exchange " << self->_options.name << " timed out";
    } );
}

void exchange_machine::settle_publish( const publish_request_ptr& r, std::exception_ptr e )
{
  if( r->timer )
    r->timer->cancel();

  bool settled = e ? _deferred.reject( r->completion, e ) : _deferred.resolve( r->completion );

  if( !settled )
    LOG( debug ) << "Discarding late publish result on exchange " << _options.name;
}

std::chrono::milliseconds
exchange_machine::resolve_publish_timeout( std::optional< std::chrono::milliseconds > timeout ) const
{
  if( timeout && timeout->count() > 0 )
    return *timeout;

  if( _options.publish_timeout.count() > 0 )
    return _options.publish_timeout;

  return _connection.publish_timeout();
}

} // namespace magpie::mq
