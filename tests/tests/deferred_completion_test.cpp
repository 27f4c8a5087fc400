#include <boost/test/unit_test.hpp>

#include <magpie/mq/deferred_completion.hpp>
#include <magpie/mq/exception.hpp>

#include <koinos/exception.hpp>
#include <koinos/log.hpp>

#include <chrono>

using namespace magpie;

struct deferred_completion_fixture
{
  deferred_completion_fixture()
  {
    koinos::initialize_logging( "magpie_test", {}, "info" );
  }

  static bool is_ready( const std::shared_future< void >& f )
  {
    return f.wait_for( std::chrono::seconds( 0 ) ) == std::future_status::ready;
  }

  mq::completion_tracker tracker;
};

BOOST_FIXTURE_TEST_SUITE( deferred_completion_tests, deferred_completion_fixture )

BOOST_AUTO_TEST_CASE( settles_once )
{
  try
  {
    auto c = std::make_shared< mq::deferred_completion >();
    auto f = c->future();

    BOOST_REQUIRE( !c->settled() );
    BOOST_REQUIRE( !is_ready( f ) );

    BOOST_REQUIRE( c->resolve() );
    BOOST_REQUIRE( c->settled() );
    BOOST_REQUIRE( is_ready( f ) );

    BOOST_TEST_MESSAGE( "Later settlements are ignored" );
    BOOST_REQUIRE( !c->resolve() );
    BOOST_REQUIRE( !c->reject( std::make_exception_ptr( mq::publish_error( "late" ) ) ) );
    BOOST_REQUIRE_NO_THROW( f.get() );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( tracker_removes_settled_completions )
{
  try
  {
    auto a = std::make_shared< mq::deferred_completion >();
    auto b = std::make_shared< mq::deferred_completion >();

    tracker.add( a );
    tracker.add( b );
    BOOST_REQUIRE_EQUAL( tracker.size(), 2 );

    BOOST_REQUIRE( tracker.resolve( a ) );
    BOOST_REQUIRE_EQUAL( tracker.size(), 1 );

    BOOST_REQUIRE( tracker.reject( b, std::make_exception_ptr( mq::publish_timeout_error( "timeout" ) ) ) );
    BOOST_REQUIRE_EQUAL( tracker.size(), 0 );
    BOOST_REQUIRE_THROW( b->future().get(), mq::publish_timeout_error );

    BOOST_TEST_MESSAGE( "Settling an untracked completion does not settle it twice" );
    BOOST_REQUIRE( !tracker.resolve( b ) );
    BOOST_REQUIRE_THROW( b->future().get(), mq::publish_timeout_error );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( reject_all_rejects_each_pending_completion_once )
{
  try
  {
    std::vector< mq::deferred_completion_ptr > completions;
    for( std::size_t i = 0; i < 5; i++ )
    {
      completions.push_back( std::make_shared< mq::deferred_completion >() );
      tracker.add( completions.back() );
    }

    BOOST_TEST_MESSAGE( "A completion settled outside the tracker is skipped" );
    completions[ 2 ]->resolve();

    auto cause = std::make_exception_ptr( mq::exchange_definition_error( "denied" ) );
    BOOST_REQUIRE_EQUAL( tracker.reject_all( cause ), 4 );
    BOOST_REQUIRE_EQUAL( tracker.size(), 0 );

    for( std::size_t i = 0; i < completions.size(); i++ )
    {
      if( i == 2 )
        BOOST_REQUIRE_NO_THROW( completions[ i ]->future().get() );
      else
        BOOST_REQUIRE_THROW( completions[ i ]->future().get(), mq::exchange_definition_error );
    }

    BOOST_REQUIRE_EQUAL( tracker.reject_all( cause ), 0 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_SUITE_END()
