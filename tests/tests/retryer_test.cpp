#include <boost/test/unit_test.hpp>

#include <magpie/mq/retryer.hpp>

#include <koinos/exception.hpp>
#include <koinos/log.hpp>

#include <boost/asio/io_context.hpp>

#include <optional>

using namespace magpie;

struct retryer_fixture
{
  retryer_fixture()
  {
    koinos::initialize_logging( "magpie_test", {}, "info" );
  }

  boost::asio::io_context ioc;
  mq::retryer retry{ ioc, std::chrono::milliseconds( 8 ) };
};

BOOST_FIXTURE_TEST_SUITE( retryer_tests, retryer_fixture )

BOOST_AUTO_TEST_CASE( first_attempt_success )
{
  try
  {
    std::size_t attempts = 0;
    std::optional< mq::error_code > result;

    retry.with_policy(
      mq::retry_policy::exponential_backoff,
      [ & ]()
      {
        attempts++;
        return mq::error_code::success;
      },
      "test operation",
      [ & ]( mq::error_code ec )
      {
        result = ec;
      } );

    BOOST_REQUIRE_EQUAL( attempts, 1 );
    BOOST_REQUIRE( result && *result == mq::error_code::success );
    BOOST_REQUIRE_EQUAL( retry.pending(), 0 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( no_retry_policy_fails_immediately )
{
  try
  {
    std::size_t attempts = 0;
    std::optional< mq::error_code > result;

    retry.with_policy(
      mq::retry_policy::none,
      [ & ]()
      {
        attempts++;
        return mq::error_code::failure;
      },
      std::nullopt,
      [ & ]( mq::error_code ec )
      {
        result = ec;
      } );

    BOOST_REQUIRE_EQUAL( attempts, 1 );
    BOOST_REQUIRE( result && *result == mq::error_code::failure );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( backs_off_until_success )
{
  try
  {
    std::size_t attempts = 0;
    std::optional< mq::error_code > result;

    retry.with_policy(
      mq::retry_policy::exponential_backoff,
      [ & ]()
      {
        return ++attempts < 4 ? mq::error_code::failure : mq::error_code::success;
      },
      "test operation",
      [ & ]( mq::error_code ec )
      {
        result = ec;
      },
      std::chrono::milliseconds( 1 ) );

    BOOST_REQUIRE( !result );
    BOOST_REQUIRE_EQUAL( retry.pending(), 1 );

    ioc.run();

    BOOST_REQUIRE_EQUAL( attempts, 4 );
    BOOST_REQUIRE( result && *result == mq::error_code::success );
    BOOST_REQUIRE_EQUAL( retry.pending(), 0 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( non_retryable_errors_complete )
{
  try
  {
    std::size_t attempts = 0;
    std::optional< mq::error_code > result;

    retry.with_policy(
      mq::retry_policy::exponential_backoff,
      [ & ]()
      {
        return ++attempts < 2 ? mq::error_code::failure : mq::error_code::rejected;
      },
      std::nullopt,
      [ & ]( mq::error_code ec )
      {
        result = ec;
      },
      std::chrono::milliseconds( 1 ) );

    ioc.run();

    BOOST_REQUIRE_EQUAL( attempts, 2 );
    BOOST_REQUIRE( result && *result == mq::error_code::rejected );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( cancel_completes_with_failure )
{
  try
  {
    std::size_t attempts = 0;
    std::optional< mq::error_code > result;

    retry.with_policy(
      mq::retry_policy::exponential_backoff,
      [ & ]()
      {
        attempts++;
        return mq::error_code::failure;
      },
      "test operation",
      [ & ]( mq::error_code ec )
      {
        result = ec;
      },
      std::chrono::milliseconds( 1'000 ) );

    retry.cancel();
    ioc.run();

    BOOST_REQUIRE_EQUAL( attempts, 1 );
    BOOST_REQUIRE( result && *result == mq::error_code::failure );
    BOOST_REQUIRE_EQUAL( retry.pending(), 0 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_SUITE_END()
