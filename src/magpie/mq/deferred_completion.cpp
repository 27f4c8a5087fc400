#include <magpie/mq/deferred_completion.hpp>

#include <algorithm>

namespace magpie::mq {

deferred_completion::deferred_completion():
    _future( _promise.get_future().share() )
{}

std::shared_future< void > deferred_completion::future() const
{
  return _future;
}

bool deferred_completion::resolve()
{
  if( _settled )
    return false;

  _settled = true;
  _promise.set_value();
  return true;
}

bool deferred_completion::reject( std::exception_ptr e )
{
  if( _settled )
    return false;

  _settled = true;
  _promise.set_exception( e );
  return true;
}

bool deferred_completion::settled() const
{
  return _settled;
}

void completion_tracker::add( const deferred_completion_ptr& c )
{
  _pending.push_back( c );
}

void completion_tracker::remove( const deferred_completion_ptr& c )
{
  auto it = std::find( _pending.begin(), _pending.end(), c );
  if( it != _pending.end() )
    _pending.erase( it );
}

bool completion_tracker::resolve( const deferred_completion_ptr& c )
{
  remove( c );
  return c->resolve();
}

bool completion_tracker::reject( const deferred_completion_ptr& c, std::exception_ptr e )
{
  remove( c );
  return c->reject( e );
}

std::size_t completion_tracker::reject_all( std::exception_ptr e )
{
  std::list< deferred_completion_ptr > pending;
  pending.swap( _pending );

  std::size_t rejected = 0;
  for( auto& c: pending )
  {
    if( c->reject( e ) )
      rejected++;
  }

  return rejected;
}

std::size_t completion_tracker::size() const
{
  return _pending.size();
}

} // namespace magpie::mq
