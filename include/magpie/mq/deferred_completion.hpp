#pragma once

#include <exception>
#include <future>
#include <list>
#include <memory>

namespace magpie::mq {

/**
 * The machine's side of an outstanding publish, check or destroy call.
 *
 * Settles at most once. Later calls to resolve() or reject() return false and
 * leave the caller's future untouched.
 */
class deferred_completion final
{
public:
  deferred_completion();

  std::shared_future< void > future() const;

  bool resolve();
  bool reject( std::exception_ptr e );

  bool settled() const;

private:
  std::promise< void > _promise;
  std::shared_future< void > _future;
  bool _settled = false;
};

using deferred_completion_ptr = std::shared_ptr< deferred_completion >;

/**
 * Completions the machine still owes an answer. A transition into the failed
 * state rejects everything tracked here and empties the list.
 */
class completion_tracker final
{
public:
  void add( const deferred_completion_ptr& c );

  void remove( const deferred_completion_ptr& c );

  bool resolve( const deferred_completion_ptr& c );
  bool reject( const deferred_completion_ptr& c, std::exception_ptr e );

  std::size_t reject_all( std::exception_ptr e );

  std::size_t size() const;

private:
  std::list< deferred_completion_ptr > _pending;
};

} // namespace magpie::mq
