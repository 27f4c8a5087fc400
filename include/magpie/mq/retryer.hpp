#pragma once

#include <magpie/mq/message_broker.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

using namespace std::chrono_literals;

namespace magpie::mq {

/**
 * Runs an operation on the io_context, retrying failures with an exponential
 * back-off until it succeeds, the policy gives up, or the retryer is canceled.
 *
 * Only error_code::failure is retried; any other result completes the attempt.
 */
class retryer final
{
public:
  using operation_func  = std::function< error_code( void ) >;
  using completion_func = std::function< void( error_code ) >;

  retryer( boost::asio::io_context& ioc, std::chrono::milliseconds max_timeout );
  ~retryer();

  void with_policy( retry_policy policy,
                    operation_func fn,
                    std::optional< std::string > message,
                    completion_func on_complete,
                    std::chrono::milliseconds timeout = 1'000ms );

  void cancel();

  std::size_t pending() const;

  using timer_ptr = std::shared_ptr< boost::asio::steady_timer >;

private:
  void retry_logic( const boost::system::error_code& ec,
                    timer_ptr timer,
                    operation_func f,
                    completion_func c,
                    std::chrono::milliseconds t,
                    std::optional< std::string > m );

  void add_timer( timer_ptr t );
  void remove_timer( timer_ptr t );

  boost::asio::io_context& _ioc;
  std::chrono::milliseconds _max_timeout;
  std::set< timer_ptr > _timers;
  bool _canceled = false;
};

} // namespace magpie::mq
