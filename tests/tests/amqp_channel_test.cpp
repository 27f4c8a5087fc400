#include <boost/test/unit_test.hpp>

#include <test_fixtures/broker_fixture.hpp>

#include <magpie/mq/exchange_machine.hpp>

#include <koinos/exception.hpp>

BOOST_FIXTURE_TEST_SUITE( amqp_channel_tests, broker_fixture )

BOOST_AUTO_TEST_CASE( define_declares_exchange_in_confirm_mode )
{
  try
  {
    connect();

    options.alternate_exchange = "unroutable";
    auto ch                    = make_channel();

    auto defined = define( ch );
    BOOST_REQUIRE( is_ready( defined ) );
    BOOST_REQUIRE_NO_THROW( defined.get() );

    std::vector< std::string > expected = { "open:1", "confirm:1", "exchange:test-exchange" };
    BOOST_REQUIRE( broker->calls == expected );
    BOOST_REQUIRE_EQUAL( broker->exchange_arguments[ "test-exchange" ][ mq::argument::alternate_exchange ],
                         "unroutable" );

    BOOST_TEST_MESSAGE( "The exchange is reported to the topology and asserted on the next configure" );
    broker->calls.clear();
    BOOST_REQUIRE( topology.configure() == mq::error_code::success );

    expected = { "open:2", "exchange:test-exchange", "close:2" };
    BOOST_REQUIRE( broker->calls == expected );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( define_failure_rejects )
{
  try
  {
    connect();
    broker->exchange_result = mq::error_code::failure;

    auto defined = define( make_channel() );
    BOOST_REQUIRE( rejects_with< mq::exchange_definition_error >( defined ) );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( confirms_settle_by_delivery_tag )
{
  try
  {
    connect();
    auto ch = make_channel();
    define( ch );

    auto a = publish( ch, "a" );
    auto b = publish( ch, "b" );
    auto c = publish( ch, "c" );
    run();

    BOOST_REQUIRE_EQUAL( broker->published.size(), 3 );
    BOOST_CHECK_EQUAL( broker->published[ 0 ].tag, 1 );
    BOOST_CHECK_EQUAL( broker->published[ 1 ].tag, 2 );
    BOOST_CHECK_EQUAL( broker->published[ 2 ].tag, 3 );
    BOOST_CHECK_EQUAL( broker->published[ 0 ].msg.exchange, "test-exchange" );

    BOOST_REQUIRE_EQUAL( log->count(), 3 );
    BOOST_REQUIRE_EQUAL( ch->outstanding(), 3 );

    BOOST_TEST_MESSAGE( "An ack settles only the publish carrying its tag" );
    broker->ack( 1, 2 );
    settle();

    BOOST_REQUIRE( is_ready( b ) );
    BOOST_REQUIRE_NO_THROW( b.get() );
    BOOST_REQUIRE( !is_ready( a ) );
    BOOST_REQUIRE( !is_ready( c ) );
    BOOST_REQUIRE_EQUAL( log->count(), 2 );

    BOOST_TEST_MESSAGE( "A nack rejects its caller and clears the entry" );
    broker->nack( 1, 3 );
    settle();

    BOOST_REQUIRE( rejects_with< mq::publish_rejected_error >( c ) );
    BOOST_REQUIRE( !is_ready( a ) );
    BOOST_REQUIRE_EQUAL( log->count(), 1 );

    BOOST_TEST_MESSAGE( "A confirm arriving late still clears its entry" );
    broker->ack( 1, 1 );
    settle();

    BOOST_REQUIRE_NO_THROW( a.get() );
    BOOST_REQUIRE_EQUAL( log->count(), 0 );
    BOOST_REQUIRE_EQUAL( ch->outstanding(), 0 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( multiple_ack_settles_earlier_tags )
{
  try
  {
    connect();
    auto ch = make_channel();
    define( ch );

    auto a = publish( ch, "a" );
    auto b = publish( ch, "b" );
    auto c = publish( ch, "c" );
    run();

    broker->ack( 1, 2, true );
    settle();

    BOOST_REQUIRE_NO_THROW( a.get() );
    BOOST_REQUIRE_NO_THROW( b.get() );
    BOOST_REQUIRE( !is_ready( c ) );
    BOOST_REQUIRE_EQUAL( log->count(), 1 );

    BOOST_TEST_MESSAGE( "Confirms for another channel are ignored" );
    broker->ack( 7, 3 );
    settle();
    BOOST_REQUIRE( !is_ready( c ) );

    broker->nack( 1, 3, true );
    settle();
    BOOST_REQUIRE( rejects_with< mq::publish_rejected_error >( c ) );
    BOOST_REQUIRE_EQUAL( log->count(), 0 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( failed_send_keeps_entry_for_replay )
{
  try
  {
    connect();
    auto ch = make_channel();
    define( ch );

    broker->fail_publish = true;
    auto f               = publish( ch, "lost" );
    run();

    BOOST_REQUIRE( rejects_with< mq::publish_error >( f ) );
    BOOST_REQUIRE_EQUAL( log->count(), 1 );
    BOOST_REQUIRE( broker->published.empty() );

    BOOST_TEST_MESSAGE( "The connection notices the loss and reconnects" );
    broker->fail_publish = false;
    settle();

    BOOST_REQUIRE_EQUAL( reconnects, 1 );
    BOOST_REQUIRE_EQUAL( log->count(), 1 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( publish_while_disconnected_is_not_logged )
{
  try
  {
    connect();
    auto ch = make_channel();
    define( ch );

    broker->drop();

    auto f = publish( ch, "nowhere" );
    run();

    BOOST_REQUIRE( rejects_with< mq::connection_not_connected >( f ) );
    BOOST_REQUIRE_EQUAL( log->count(), 0 );
    BOOST_REQUIRE( broker->published.empty() );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( lost_connection_rejects_unconfirmed_publishes )
{
  try
  {
    connect();
    auto ch = make_channel();
    define( ch );

    auto f = publish( ch, "in-flight" );
    run();
    BOOST_REQUIRE_EQUAL( ch->outstanding(), 1 );

    broker->drop();
    settle();

    BOOST_REQUIRE( rejects_with< mq::publish_error >( f ) );
    BOOST_REQUIRE_EQUAL( ch->outstanding(), 0 );
    BOOST_REQUIRE_EQUAL( reconnects, 1 );

    BOOST_TEST_MESSAGE( "The entry stays for replay after the reconnect" );
    BOOST_REQUIRE_EQUAL( log->count(), 1 );

    BOOST_TEST_MESSAGE( "A reused channel number does not reach the old channel" );
    broker->ack( 1, 1 );
    settle();
    BOOST_REQUIRE_EQUAL( log->count(), 1 );
    BOOST_REQUIRE_EQUAL( released, 0 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( server_close_releases_once )
{
  try
  {
    connect();
    auto ch = make_channel();
    define( ch );

    auto f = publish( ch, "in-flight" );
    run();

    broker->close_channel_from_server( 1 );
    settle();

    BOOST_REQUIRE_EQUAL( released, 1 );
    BOOST_REQUIRE( rejects_with< mq::channel_released >( f ) );
    BOOST_REQUIRE_EQUAL( log->count(), 1 );

    BOOST_TEST_MESSAGE( "Publishing on a released channel is refused without logging" );
    auto after = publish( ch, "after" );
    run();
    BOOST_REQUIRE( rejects_with< mq::channel_released >( after ) );
    BOOST_REQUIRE_EQUAL( log->count(), 1 );

    broker->close_channel_from_server( 1 );
    settle();
    BOOST_REQUIRE_EQUAL( released, 1 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( destroy_closes_channel )
{
  try
  {
    connect();
    auto ch = make_channel();
    define( ch );

    auto f = publish( ch, "in-flight" );
    run();

    auto [ handler, destroyed ] = completion();
    ch->destroy( handler );
    run();

    BOOST_REQUIRE_NO_THROW( destroyed.get() );
    BOOST_REQUIRE( broker->calls.back() == "close:1" );
    BOOST_REQUIRE( rejects_with< mq::channel_released >( f ) );
    BOOST_REQUIRE_EQUAL( released, 0 );

    BOOST_TEST_MESSAGE( "Confirms after destroy are ignored" );
    broker->ack( 1, 1 );
    settle();
    BOOST_REQUIRE_EQUAL( log->count(), 1 );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_CASE( caller_timeout_does_not_wait_for_confirm )
{
  try
  {
    connect();

    options.publish_timeout = std::chrono::milliseconds( 20 );

    auto machine = mq::exchange_machine::create( ioc,
                                                 options,
                                                 connection,
                                                 topology,
                                                 std::make_shared< mq::amqp_channel_factory >( connection ) );

    auto checked = machine->check();
    settle();
    BOOST_REQUIRE_NO_THROW( checked.get() );

    mq::message msg;
    msg.routing_key = "test.key";
    msg.data        = "slow";

    auto slow = machine->publish( msg );
    settle( std::chrono::milliseconds( 200 ) );

    BOOST_REQUIRE( rejects_with< mq::publish_timeout_error >( slow ) );
    BOOST_REQUIRE_EQUAL( machine->unconfirmed(), 1 );
    BOOST_REQUIRE_EQUAL( broker->published.size(), 1 );

    auto channel = broker->published[ 0 ].channel;

    BOOST_TEST_MESSAGE( "The next publish is settled by its own confirm, not the late one" );
    msg.data  = "next";
    auto next = machine->publish( msg, std::chrono::milliseconds( 60'000 ) );
    settle();

    BOOST_REQUIRE_EQUAL( broker->published.size(), 2 );
    broker->nack( channel, broker->published[ 1 ].tag );
    broker->ack( channel, broker->published[ 0 ].tag );
    settle();

    BOOST_REQUIRE( rejects_with< mq::publish_rejected_error >( next ) );
    BOOST_REQUIRE_EQUAL( machine->unconfirmed(), 0 );

    auto destroyed = machine->destroy();
    settle();
    BOOST_REQUIRE_NO_THROW( destroyed.get() );
  }
  KOINOS_CATCH_LOG_AND_RETHROW( info )
}

BOOST_AUTO_TEST_SUITE_END()
