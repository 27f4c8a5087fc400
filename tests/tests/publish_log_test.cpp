#include <boost/test/unit_test.hpp>

#include <magpie/mq/publish_log.hpp>

#include <koinos/exception.hpp>
#include <koinos/log.hpp>

using namespace magpie;

struct publish_log_fixture
{
  publish_log_fixture()
  {
    koinos::initialize_logging( "magpie_test", {}, "info" );
  }

  mq::message make_message( const std::string& data )
  {
    mq::message msg;
    msg.exchange    = "test-exchange";
    msg.routing_key = "test.key";
    msg.data        = data;
    return msg;
  }

  mq::publish_log log;
};

BOOST_FIXTURE_TEST_SUITE( publish_log_tests, publish_log_fixture )

BOOST_AUTO_TEST_CASE( append_and_confirm )
{
  try
  {
    auto a = log.append( make_message( "a" ) );
    auto b = log.append( make_message( "b" ) );

    BOOST_REQUIRE_NE( a, b );
    BOOST_REQUIRE_EQUAL( log.count(), 2 );

    BOOST_REQUIRE( log.confirm( a ) );
    BOOST_REQUIRE_EQUAL( log.count(), 1 );

    BOOST_TEST_MESSAGE( "Confirming an entry twice is a no-op" );
    BOOST_REQUIRE( !log.confirm( a ) );
    BOOST_REQUIRE_EQUAL( log.count(), 1 );

    BOOST_TEST_MESSAGE( "Confirming an unknown entry is a no-op" );
    BOOST_REQUIRE( !log.confirm( b + 100 ) );
    BOOST_REQUIRE_EQUAL( log.count(), 1 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( duplicates_are_kept )
{
  try
  {
    log.append( make_message( "same" ) );
    log.append( make_message( "same" ) );

    BOOST_REQUIRE_EQUAL( log.count(), 2 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( reset_returns_messages_in_send_order )
{
  try
  {
    std::vector< mq::publish_log::sequence_number > seqs;
    for( std::size_t i = 0; i < 20; i++ )
      seqs.push_back( log.append( make_message( std::to_string( i ) ) ) );

    log.confirm( seqs[ 3 ] );
    log.confirm( seqs[ 11 ] );

    auto messages = log.reset();

    BOOST_REQUIRE_EQUAL( log.count(), 0 );
    BOOST_REQUIRE_EQUAL( messages.size(), 18 );

    std::vector< std::string > expected;
    for( std::size_t i = 0; i < 20; i++ )
    {
      if( i != 3 && i != 11 )
        expected.push_back( std::to_string( i ) );
    }

    for( std::size_t i = 0; i < expected.size(); i++ )
      BOOST_CHECK_EQUAL( messages[ i ].data, expected[ i ] );

    BOOST_TEST_MESSAGE( "Entries confirmed after a reset are ignored" );
    BOOST_REQUIRE( !log.confirm( seqs[ 0 ] ) );
    BOOST_REQUIRE( log.reset().empty() );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( sequence_numbers_survive_reset )
{
  try
  {
    auto before = log.append( make_message( "before" ) );
    log.reset();
    auto after = log.append( make_message( "after" ) );

    BOOST_REQUIRE_GT( after, before );

    BOOST_TEST_MESSAGE( "A stale confirmation cannot remove a newer entry" );
    BOOST_REQUIRE( !log.confirm( before ) );
    BOOST_REQUIRE_EQUAL( log.count(), 1 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_SUITE_END()
