#include <magpie/mq/retryer.hpp>

#include <koinos/log.hpp>

#include <boost/asio/placeholders.hpp>
#include <boost/bind/bind.hpp>

#include <algorithm>

namespace magpie::mq {

retryer::retryer( boost::asio::io_context& ioc, std::chrono::milliseconds max_timeout ):
    _ioc( ioc ),
    _max_timeout( max_timeout )
{}

retryer::~retryer()
{
  cancel();
}

void retryer::cancel()
{
  _canceled = true;
  for( const auto& timer: _timers )
    timer->cancel();
}

std::size_t retryer::pending() const
{
  return _timers.size();
}

void retryer::add_timer( timer_ptr t )
{
  _timers.insert( t );
}

void retryer::remove_timer( timer_ptr t )
{
  auto it = _timers.find( t );
  if( it != _timers.end() )
    _timers.erase( it );
}

void retryer::retry_logic( const boost::system::error_code& ec,
                           timer_ptr timer,
                           operation_func f,
                           completion_func c,
                           std::chrono::milliseconds t,
                           std::optional< std::string > m )
{
  if( ec == boost::asio::error::operation_aborted || _canceled )
  {
    remove_timer( timer );
    c( error_code::failure );
    return;
  }

  error_code e = f();

  if( e == error_code::failure )
  {
    t = std::min( t * 2, _max_timeout );

    if( m )
      LOG( warning ) << "Failure during " << *m << ", retrying in " << t.count() << "ms";

    timer->expires_after( t );
    timer->async_wait(
      boost::bind( &retryer::retry_logic, this, boost::asio::placeholders::error, timer, f, c, t, m ) );
  }
  else
  {
    remove_timer( timer );
    c( e );
  }
}

void retryer::with_policy( retry_policy policy,
                           operation_func fn,
                           std::optional< std::string > message,
                           completion_func on_complete,
                           std::chrono::milliseconds timeout )
{
  _canceled = false;

  if( error_code e = fn(); e != error_code::failure )
  {
    on_complete( e );
    return;
  }

  switch( policy )
  {
    case retry_policy::none:
      on_complete( error_code::failure );
      break;
    case retry_policy::exponential_backoff:
      {
        if( message )
          LOG( warning ) << "Failure during " << *message << ", retrying in " << timeout.count() << "ms";

        auto timer = std::make_shared< boost::asio::steady_timer >( _ioc );
        timer->expires_after( timeout );
        timer->async_wait( boost::bind( &retryer::retry_logic,
                                        this,
                                        boost::asio::placeholders::error,
                                        timer,
                                        fn,
                                        on_complete,
                                        timeout,
                                        message ) );
        add_timer( timer );
        break;
      }
  }
}

} // namespace magpie::mq
