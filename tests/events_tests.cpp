#include <gtest/gtest.h>
#include <sendme/events.hpp>
#include <boost/thread/thread.hpp>
#include <boost/bind.hpp>

using namespace sm;

namespace {
  void post_later( event_channel* c ) {
    boost::this_thread::sleep( boost::posix_time::milliseconds(50) );
    event e( event::session_complete );
    c->post(e);
  }
}

TEST( event_channel, preserves_order ) {
  event_channel c;
  for( int i = 0; i < 5; ++i ) {
    event e( event::blob_progress );
    e.bytes_done = i;
    c.post(e);
  }
  EXPECT_EQ( 5u, c.size() );
  event e;
  for( int i = 0; i < 5; ++i ) {
    ASSERT_TRUE( c.try_next(e) );
    EXPECT_EQ( uint64_t(i), e.bytes_done );
  }
  EXPECT_FALSE( c.try_next(e) );
}

TEST( event_channel, next_times_out ) {
  event_channel c;
  event e;
  EXPECT_FALSE( c.next( e, fc::milliseconds(20) ) );
}

TEST( event_channel, next_wakes_on_post_from_another_thread ) {
  event_channel c;
  boost::thread t( boost::bind( post_later, &c ) );
  event e;
  EXPECT_TRUE( c.next( e, fc::seconds(5) ) );
  EXPECT_EQ( event::session_complete, e.type );
  t.join();
}

TEST( event_channel, close_drains_then_stops ) {
  event_channel c;
  c.post( event( event::session_started ) );
  c.close();
  c.post( event( event::session_failed ) );
  EXPECT_TRUE( c.is_closed() );

  event e;
  EXPECT_TRUE( c.next( e, fc::milliseconds(10) ) );
  EXPECT_EQ( event::session_started, e.type );
  EXPECT_FALSE( c.next( e, fc::seconds(5) ) );
}

TEST( event, renders_failures ) {
  event e( event::blob_failed );
  e.path   = "a/b.txt";
  e.reason = failure::hash_mismatch;
  EXPECT_EQ( std::string("failed a/b.txt: hash mismatch"), std::string( e.to_string().c_str() ) );

  event p( event::path_selected );
  p.conn_path = relayed_path;
  EXPECT_EQ( std::string("connected via relayed path"), std::string( p.to_string().c_str() ) );
}
